#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zf::engine
{

struct MilestoneThreshold
{
    std::string stage_name;
    std::int64_t min_minutes = 0;
    std::string icon_token;
};

struct StageResolution
{
    std::size_t stage_index = 0;
    std::string stage_name;
    std::string icon_token;
    std::int64_t stage_min_minutes = 0;
    std::optional<std::int64_t> next_threshold;
    double progress_fraction = 0.0;
};

// Immutable, validated threshold table. Resolution depends only on the table
// and the minute total, so writer and widget always agree on the stage.
class StageTable
{
  public:
    // Rejects empty tables, a first threshold other than 0, and thresholds
    // that are not strictly increasing.
    static std::optional<StageTable>
    create(std::vector<MilestoneThreshold> thresholds);

    // Seed, Sprout, Sapling, Young Tree, Mature Tree, Ancient Tree at
    // 0/30/120/300/600/1200 minutes.
    static StageTable const &tree_growth();

    StageResolution resolve(std::int64_t total_minutes) const;
    std::optional<std::int64_t>
    minutes_until_next_stage(std::int64_t total_minutes) const;

    std::size_t size() const noexcept { return thresholds_.size(); }
    MilestoneThreshold const &at(std::size_t index) const
    {
        return thresholds_.at(index);
    }

  private:
    explicit StageTable(std::vector<MilestoneThreshold> thresholds);

    std::vector<MilestoneThreshold> thresholds_;
};

// Whole percent, truncated, for display.
int progress_percentage(double fraction) noexcept;

} // namespace zf::engine
