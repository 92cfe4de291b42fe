#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace zf::log
{

void append_log_line_to_file(std::string const &line)
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        auto root = zf::utils::data_root();
        s_path = root.empty() ? std::filesystem::path("zenflow.log")
                              : root / "zenflow.log";
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace zf::log
