#include "engine/ChangeSignal.hpp"

#include "utils/Log.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace zf::engine
{

std::optional<std::string>
read_marker_token(std::filesystem::path const &marker_path)
{
    std::ifstream input(marker_path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::string token((std::istreambuf_iterator<char>(input)),
                      std::istreambuf_iterator<char>());
    while (!token.empty() && (token.back() == '\n' || token.back() == '\r'))
    {
        token.pop_back();
    }
    return token;
}

std::uint64_t marker_generation(std::string const &token)
{
    std::uint64_t generation = 0;
    auto const *end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, generation);
    if (ec != std::errc{})
    {
        return 0;
    }
    return generation;
}

MarkerFileBroadcaster::MarkerFileBroadcaster(std::filesystem::path marker_path)
    : path_(std::move(marker_path))
{
}

bool MarkerFileBroadcaster::broadcast()
{
    if (path_.empty())
    {
        return false;
    }

    std::uint64_t generation = 0;
    if (auto current = read_marker_token(path_))
    {
        generation = marker_generation(*current);
    }
    auto const stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    // The timestamp keeps tokens distinct even if two writers race on the
    // same generation.
    auto const token = std::format("{} {}\n", generation + 1, stamp);

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            ZF_LOG_WARN("unable to create signal directory {}: {}",
                        parent.string(), ec.message());
            return false;
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream output(tmp, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            ZF_LOG_WARN("unable to open signal file {}", tmp.string());
            return false;
        }
        output << token;
        output.flush();
        if (!output)
        {
            ZF_LOG_WARN("unable to write signal file {}", tmp.string());
            output.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }
    std::filesystem::rename(tmp, path_, ec);
    if (ec)
    {
        ZF_LOG_WARN("unable to publish signal file {}: {}", path_.string(),
                    ec.message());
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        return false;
    }
    ZF_LOG_DEBUG("change signal generation {}", generation + 1);
    return true;
}

ChangeWatcher::ChangeWatcher(std::filesystem::path marker_path)
    : path_(std::move(marker_path)), last_token_(read_marker_token(path_))
{
}

bool ChangeWatcher::poll()
{
    auto token = read_marker_token(path_);
    if (token == last_token_)
    {
        return false;
    }
    last_token_ = std::move(token);
    // A marker that disappeared is not a change in committed state.
    return last_token_.has_value();
}

} // namespace zf::engine
