#include "app/JsonOutput.hpp"

#include "utils/Json.hpp"

#include <optional>

#include <yyjson.h>

namespace zf::app
{

namespace
{

char const *status_name(engine::ProgressService::RecordStatus status)
{
    switch (status)
    {
    case engine::ProgressService::RecordStatus::Ok:
        return "ok";
    case engine::ProgressService::RecordStatus::InvalidDuration:
        return "invalid-duration";
    case engine::ProgressService::RecordStatus::StoreWriteFailed:
        return "store-write-failed";
    }
    return "unknown";
}

char const *requirement_name(engine::BadgeRequirement requirement)
{
    switch (requirement)
    {
    case engine::BadgeRequirement::Streak:
        return "streak";
    case engine::BadgeRequirement::TotalMinutes:
        return "totalMinutes";
    }
    return "unknown";
}

void add_instant(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
                 std::optional<engine::Instant> const &instant)
{
    if (instant)
    {
        yyjson_mut_obj_add_sint(doc, obj, key,
                                engine::to_epoch_seconds(*instant));
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, key);
    }
}

void add_optional_int(yyjson_mut_doc *doc, yyjson_mut_val *obj,
                      char const *key, std::optional<std::int64_t> value)
{
    if (value)
    {
        yyjson_mut_obj_add_sint(doc, obj, key, *value);
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, key);
    }
}

yyjson_mut_val *state_object(yyjson_mut_doc *doc,
                             engine::AggregateState const &state)
{
    auto *obj = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_sint(doc, obj, "totalMinutes", state.total_minutes);
    yyjson_mut_obj_add_int(doc, obj, "currentStreak", state.current_streak);
    yyjson_mut_obj_add_int(doc, obj, "longestStreak", state.longest_streak);
    yyjson_mut_obj_add_sint(doc, obj, "totalSessions", state.total_sessions);
    add_instant(doc, obj, "lastSessionDate", state.last_session_date);
    return obj;
}

yyjson_mut_val *session_object(yyjson_mut_doc *doc,
                               engine::Session const &session)
{
    auto *obj = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_sint(doc, obj, "date",
                            engine::to_epoch_seconds(session.timestamp));
    yyjson_mut_obj_add_sint(doc, obj, "durationMinutes",
                            session.duration_minutes);
    return obj;
}

} // namespace

std::string serialize_snapshot(engine::Snapshot const &snapshot)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);

    yyjson_mut_obj_add_sint(native, root, "asOf",
                            engine::to_epoch_seconds(snapshot.as_of));
    yyjson_mut_obj_add_val(native, root, "state",
                           state_object(native, snapshot.state));
    yyjson_mut_obj_add_uint(native, root, "stageIndex", snapshot.stage_index);
    yyjson_mut_obj_add_strcpy(native, root, "stageName",
                              snapshot.stage_name.c_str());
    yyjson_mut_obj_add_strcpy(native, root, "iconToken",
                              snapshot.icon_token.c_str());
    add_optional_int(native, root, "nextStageThreshold",
                     snapshot.next_stage_threshold);
    yyjson_mut_obj_add_real(native, root, "progressFraction",
                            snapshot.progress_fraction);
    yyjson_mut_obj_add_int(native, root, "progressPercentage",
                           snapshot.progress_percentage);
    add_optional_int(native, root, "minutesUntilNextStage",
                     snapshot.minutes_until_next_stage);
    yyjson_mut_obj_add_bool(native, root, "placeholder", snapshot.placeholder);
    return doc.write("{}");
}

std::string serialize_statistics(engine::ProgressStatistics const &stats,
                                 int effective_streak)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);

    yyjson_mut_obj_add_sint(native, root, "totalSessions", stats.total_sessions);
    yyjson_mut_obj_add_sint(native, root, "totalMinutes", stats.total_minutes);
    yyjson_mut_obj_add_sint(native, root, "averageSessionMinutes",
                            stats.average_session_minutes);
    yyjson_mut_obj_add_int(native, root, "currentStreak", stats.current_streak);
    yyjson_mut_obj_add_int(native, root, "longestStreak", stats.longest_streak);
    yyjson_mut_obj_add_int(native, root, "effectiveStreak", effective_streak);
    yyjson_mut_obj_add_bool(native, root, "streakActive", stats.streak_active);
    add_instant(native, root, "lastSessionDate", stats.last_session_date);
    return doc.write("{}");
}

std::string serialize_sessions(std::vector<engine::Session> const &sessions)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    doc.set_root(root);
    for (auto const &session : sessions)
    {
        yyjson_mut_arr_append(root, session_object(native, session));
    }
    return doc.write("[]");
}

std::string serialize_badges(std::vector<engine::BadgeStatus> const &badges)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    doc.set_root(root);
    for (auto const &entry : badges)
    {
        auto *obj = yyjson_mut_arr_add_obj(native, root);
        yyjson_mut_obj_add_strcpy(native, obj, "id", entry.badge.id.c_str());
        yyjson_mut_obj_add_strcpy(native, obj, "name",
                                  entry.badge.name.c_str());
        yyjson_mut_obj_add_str(native, obj, "requirement",
                               requirement_name(entry.badge.requirement));
        yyjson_mut_obj_add_sint(native, obj, "requiredValue",
                                entry.badge.required_value);
        yyjson_mut_obj_add_sint(native, obj, "progressValue",
                                entry.progress_value);
        yyjson_mut_obj_add_strcpy(native, obj, "iconToken",
                                  entry.badge.icon_token.c_str());
        yyjson_mut_obj_add_bool(native, obj, "unlocked", entry.unlocked);
        add_instant(native, obj, "unlockedAt", entry.unlocked_at);
    }
    return doc.write("[]");
}

std::string
serialize_record_result(engine::ProgressService::RecordResult const &result)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);

    yyjson_mut_obj_add_str(native, root, "status", status_name(result.status));
    yyjson_mut_obj_add_val(native, root, "state",
                           state_object(native, result.state));
    auto *unlocked = yyjson_mut_arr(native);
    for (auto const &unlock : result.unlocked)
    {
        yyjson_mut_arr_add_strcpy(native, unlocked, unlock.id.c_str());
    }
    yyjson_mut_obj_add_val(native, root, "unlockedBadges", unlocked);
    return doc.write("{}");
}

std::string serialize_action(std::string_view action, bool degraded)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_strncpy(native, root, "action", action.data(),
                               action.size());
    yyjson_mut_obj_add_bool(native, root, "ok", true);
    yyjson_mut_obj_add_bool(native, root, "degraded", degraded);
    return doc.write("{}");
}

std::string serialize_error(std::string_view code, std::string_view message)
{
    json::MutableDocument doc;
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    auto *error = yyjson_mut_obj(native);
    yyjson_mut_obj_add_strncpy(native, error, "code", code.data(), code.size());
    yyjson_mut_obj_add_strncpy(native, error, "message", message.data(),
                               message.size());
    yyjson_mut_obj_add_val(native, root, "error", error);
    return doc.write("{}");
}

} // namespace zf::app
