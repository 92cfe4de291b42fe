#pragma once

#include <filesystem>
#include <optional>

namespace zf::utils
{

// Writable per-process directory for logs; "<exe dir>/data" as last resort.
std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();

// Directory shared by the writer and the widget process (the "app group"
// container). Resolved from ZF_APP_GROUP_DIR, then XDG_DATA_HOME, then HOME.
// Empty optional when none of them can be created.
std::optional<std::filesystem::path> app_group_root();

} // namespace zf::utils
