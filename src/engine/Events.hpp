#pragma once

#include "engine/Achievements.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace zf::engine
{

// Committed progress changed. Payload-less on purpose: subscribers re-read
// the gateway.
struct ProgressChangedEvent
{
};

struct StoreDegradedEvent
{
    std::filesystem::path path;
    std::string reason;
};

struct BadgesUnlockedEvent
{
    std::vector<BadgeUnlock> unlocks;
};

} // namespace zf::engine
