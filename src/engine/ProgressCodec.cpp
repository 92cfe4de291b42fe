#include "engine/ProgressCodec.hpp"

#include "utils/Json.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

#include <yyjson.h>

namespace zf::engine::codec
{

std::string encode_session(Session const &session)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return {};
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_sint(native, root, "date",
                            to_epoch_seconds(session.timestamp));
    yyjson_mut_obj_add_sint(native, root, "durationMinutes",
                            session.duration_minutes);
    return doc.write("{}");
}

std::optional<Session> decode_session(std::string_view payload)
{
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *root = doc.root();
    auto date = json::get_int(root, "date");
    auto duration = json::get_int(root, "durationMinutes");
    if (!date || !duration || *duration < 0)
    {
        return std::nullopt;
    }
    return Session{from_epoch_seconds(*date), *duration};
}

std::string encode_badge_unlocks(std::vector<BadgeUnlock> const &unlocks)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return {};
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    doc.set_root(root);
    for (auto const &unlock : unlocks)
    {
        auto *entry = yyjson_mut_arr_add_obj(native, root);
        yyjson_mut_obj_add_strcpy(native, entry, "id", unlock.id.c_str());
        yyjson_mut_obj_add_sint(native, entry, "unlockedAt",
                                to_epoch_seconds(unlock.unlocked_at));
    }
    return doc.write("[]");
}

std::optional<std::vector<BadgeUnlock>>
decode_badge_unlocks(std::string_view payload)
{
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_arr(root))
    {
        return std::nullopt;
    }

    std::vector<BadgeUnlock> result;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        auto id = json::get_string(entry, "id");
        auto at = json::get_int(entry, "unlockedAt");
        if (!id || id->empty() || !at)
        {
            continue;
        }
        auto duplicate =
            std::any_of(result.begin(), result.end(),
                        [&id](BadgeUnlock const &seen) { return seen.id == *id; });
        if (!duplicate)
        {
            result.push_back(BadgeUnlock{std::move(*id), from_epoch_seconds(*at)});
        }
    }
    return result;
}

std::string encode_integer(std::int64_t value)
{
    return std::to_string(value);
}

std::optional<std::int64_t> decode_integer(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::int64_t value = 0;
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace zf::engine::codec
