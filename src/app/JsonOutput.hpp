#pragma once

#include "engine/Achievements.hpp"
#include "engine/Progress.hpp"
#include "engine/ProgressService.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace zf::app
{

// CLI output documents. Instants are epoch seconds; absent values are null.
std::string serialize_snapshot(engine::Snapshot const &snapshot);
std::string serialize_statistics(engine::ProgressStatistics const &stats,
                                 int effective_streak);
std::string serialize_sessions(std::vector<engine::Session> const &sessions);
std::string serialize_badges(std::vector<engine::BadgeStatus> const &badges);
std::string
serialize_record_result(engine::ProgressService::RecordResult const &result);
std::string serialize_action(std::string_view action, bool degraded);
std::string serialize_error(std::string_view code, std::string_view message);

} // namespace zf::app
