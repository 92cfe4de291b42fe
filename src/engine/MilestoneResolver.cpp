#include "engine/MilestoneResolver.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace zf::engine
{

StageTable::StageTable(std::vector<MilestoneThreshold> thresholds)
    : thresholds_(std::move(thresholds))
{
}

std::optional<StageTable>
StageTable::create(std::vector<MilestoneThreshold> thresholds)
{
    if (thresholds.empty())
    {
        ZF_LOG_ERROR("stage table rejected: no thresholds");
        return std::nullopt;
    }
    if (thresholds.front().min_minutes != 0)
    {
        ZF_LOG_ERROR("stage table rejected: first threshold is {} not 0",
                     thresholds.front().min_minutes);
        return std::nullopt;
    }
    for (std::size_t i = 1; i < thresholds.size(); ++i)
    {
        if (thresholds[i].min_minutes <= thresholds[i - 1].min_minutes)
        {
            ZF_LOG_ERROR("stage table rejected: '{}' ({}) does not follow "
                         "'{}' ({})",
                         thresholds[i].stage_name, thresholds[i].min_minutes,
                         thresholds[i - 1].stage_name,
                         thresholds[i - 1].min_minutes);
            return std::nullopt;
        }
    }
    return StageTable(std::move(thresholds));
}

StageTable const &StageTable::tree_growth()
{
    static StageTable const kTable(std::vector<MilestoneThreshold>{
        {"Seed", 0, "circle.fill"},
        {"Sprout", 30, "leaf.fill"},
        {"Sapling", 120, "tree"},
        {"Young Tree", 300, "tree.fill"},
        {"Mature Tree", 600, "tree.fill"},
        {"Ancient Tree", 1200, "sparkles"},
    });
    return kTable;
}

StageResolution StageTable::resolve(std::int64_t total_minutes) const
{
    total_minutes = std::max<std::int64_t>(total_minutes, 0);

    std::size_t current = 0;
    for (std::size_t i = 0; i < thresholds_.size(); ++i)
    {
        if (thresholds_[i].min_minutes > total_minutes)
        {
            break;
        }
        current = i;
    }

    auto const &stage = thresholds_[current];
    StageResolution result;
    result.stage_index = current;
    result.stage_name = stage.stage_name;
    result.icon_token = stage.icon_token;
    result.stage_min_minutes = stage.min_minutes;

    if (current + 1 < thresholds_.size())
    {
        auto const next = thresholds_[current + 1].min_minutes;
        result.next_threshold = next;
        auto const span = static_cast<double>(next - stage.min_minutes);
        auto const done = static_cast<double>(total_minutes - stage.min_minutes);
        result.progress_fraction = std::clamp(done / span, 0.0, 1.0);
    }
    else
    {
        result.progress_fraction = 1.0;
    }
    return result;
}

std::optional<std::int64_t>
StageTable::minutes_until_next_stage(std::int64_t total_minutes) const
{
    auto resolution = resolve(total_minutes);
    if (!resolution.next_threshold)
    {
        return std::nullopt;
    }
    return std::max<std::int64_t>(
        0, *resolution.next_threshold - std::max<std::int64_t>(total_minutes, 0));
}

int progress_percentage(double fraction) noexcept
{
    return static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);
}

} // namespace zf::engine
