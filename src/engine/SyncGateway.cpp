#include "engine/SyncGateway.hpp"

#include "engine/Aggregator.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/ProgressCodec.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace zf::engine
{

namespace
{

// Rolls back unless commit() succeeded. A read transaction is never
// committed; the rollback just ends it.
class Transaction
{
  public:
    enum class Mode
    {
        Write,
        Read
    };

    explicit Transaction(storage::Database &db, Mode mode = Mode::Write)
        : db_(db), active_(mode == Mode::Write ? db.begin_transaction()
                                               : db.begin_read_transaction())
    {
    }
    ~Transaction()
    {
        if (active_ && !db_.rollback_transaction())
        {
            ZF_LOG_ERROR("transaction rollback failed");
        }
    }

    Transaction(Transaction const &) = delete;
    Transaction &operator=(Transaction const &) = delete;

    bool active() const noexcept { return active_; }

    bool commit()
    {
        if (!active_ || !db_.commit_transaction())
        {
            return false;
        }
        active_ = false;
        return true;
    }

  private:
    storage::Database &db_;
    bool active_ = false;
};

struct DecodedField
{
    std::int64_t value = 0;
    bool present = false;
    bool corrupt = false;
};

DecodedField read_field(storage::Database const &db, char const *key)
{
    DecodedField field;
    auto raw = db.get_value(key);
    if (!raw)
    {
        return field;
    }
    field.present = true;
    if (auto value = codec::decode_integer(*raw); value && *value >= 0)
    {
        field.value = *value;
    }
    else
    {
        field.corrupt = true;
        ZF_LOG_WARN("corrupt progress value {}='{}'", key, *raw);
    }
    return field;
}

int to_streak(std::int64_t value)
{
    return static_cast<int>(
        std::min<std::int64_t>(value, std::numeric_limits<int>::max()));
}

} // namespace

SyncGateway::SyncGateway(std::filesystem::path store_path, Calendar calendar,
                         EventBus *bus,
                         std::unique_ptr<ChangeBroadcaster> broadcaster)
    : store_path_(std::move(store_path)), calendar_(calendar), bus_(bus),
      broadcaster_(std::move(broadcaster))
{
    database_ = std::make_unique<storage::Database>(store_path_);
    if (database_->is_valid())
    {
        ZF_LOG_INFO("progress store opened at {}", store_path_.string());
        return;
    }

    ZF_LOG_ERROR("progress store unavailable at {}; using in-memory store",
                 store_path_.string());
    database_ = std::make_unique<storage::Database>(
        std::filesystem::path(storage::Database::kInMemoryPath));
    degraded_ = true;
    if (!database_->is_valid())
    {
        ZF_LOG_ERROR("in-memory fallback store failed to open");
    }
    if (bus_ != nullptr)
    {
        bus_->publish(StoreDegradedEvent{store_path_, "store unavailable"});
    }
}

SyncGateway::~SyncGateway() = default;

bool SyncGateway::write_state(AggregateState const &state)
{
    auto &db = *database_;
    bool ok =
        db.set_value(codec::kTotalMinutesKey,
                     codec::encode_integer(state.total_minutes)) &&
        db.set_value(codec::kCurrentStreakKey,
                     codec::encode_integer(state.current_streak)) &&
        db.set_value(codec::kLongestStreakKey,
                     codec::encode_integer(state.longest_streak)) &&
        db.set_value(codec::kTotalSessionsKey,
                     codec::encode_integer(state.total_sessions));
    if (!ok)
    {
        return false;
    }
    if (state.last_session_date)
    {
        return db.set_value(
            codec::kLastSessionDateKey,
            codec::encode_integer(to_epoch_seconds(*state.last_session_date)));
    }
    return db.remove_value(codec::kLastSessionDateKey);
}

bool SyncGateway::merge_unlocks(std::vector<BadgeUnlock> const &new_unlocks)
{
    if (new_unlocks.empty())
    {
        return true;
    }
    auto merged = read_badge_unlocks();
    for (auto const &unlock : new_unlocks)
    {
        auto exists = std::any_of(merged.begin(), merged.end(),
                                  [&unlock](BadgeUnlock const &seen)
                                  { return seen.id == unlock.id; });
        if (!exists)
        {
            merged.push_back(unlock);
        }
    }
    return database_->set_value(codec::kBadgesKey,
                                codec::encode_badge_unlocks(merged));
}

bool SyncGateway::commit(AggregateState const &state,
                         std::vector<BadgeUnlock> const &new_unlocks)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        ZF_LOG_ERROR("commit skipped: no usable store");
        return false;
    }
    Transaction tx(*database_);
    if (!tx.active())
    {
        ZF_LOG_ERROR("commit failed: unable to begin transaction");
        return false;
    }
    if (!write_state(state) || !merge_unlocks(new_unlocks))
    {
        ZF_LOG_ERROR("commit failed: progress write rejected");
        return false;
    }
    if (!tx.commit())
    {
        ZF_LOG_ERROR("commit failed: transaction not committed");
        return false;
    }
    return true;
}

bool SyncGateway::commit_session(Session const &session,
                                 AggregateState const &state,
                                 std::vector<BadgeUnlock> const &new_unlocks)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        ZF_LOG_ERROR("session commit skipped: no usable store");
        return false;
    }
    Transaction tx(*database_);
    if (!tx.active())
    {
        ZF_LOG_ERROR("session commit failed: unable to begin transaction");
        return false;
    }
    if (!database_->append_session(codec::encode_session(session)))
    {
        ZF_LOG_ERROR("session commit failed: append rejected");
        return false;
    }
    if (!write_state(state) || !merge_unlocks(new_unlocks))
    {
        ZF_LOG_ERROR("session commit failed: progress write rejected");
        return false;
    }
    if (!tx.commit())
    {
        ZF_LOG_ERROR("session commit failed: transaction not committed");
        return false;
    }
    return true;
}

bool SyncGateway::signal_changed()
{
    if (bus_ != nullptr)
    {
        bus_->publish(ProgressChangedEvent{});
    }
    if (!broadcaster_)
    {
        return false;
    }
    if (!broadcaster_->broadcast())
    {
        ZF_LOG_WARN("change broadcast failed; readers will refresh later");
        return false;
    }
    return true;
}

AggregateState SyncGateway::load() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        return {};
    }
    // All keys and the replay history come from one committed snapshot.
    Transaction tx(*database_, Transaction::Mode::Read);
    if (!tx.active())
    {
        ZF_LOG_WARN("load: unable to begin read transaction");
    }
    return read_state();
}

AggregateState SyncGateway::read_state() const
{
    AggregateState state;
    auto const &db = *database_;
    auto total = read_field(db, codec::kTotalMinutesKey);
    auto current = read_field(db, codec::kCurrentStreakKey);
    auto longest = read_field(db, codec::kLongestStreakKey);
    auto sessions_count = read_field(db, codec::kTotalSessionsKey);
    auto last_date = db.get_value(codec::kLastSessionDateKey);
    std::optional<std::int64_t> last_epoch;
    bool last_corrupt = false;
    if (last_date)
    {
        last_epoch = codec::decode_integer(*last_date);
        if (!last_epoch)
        {
            last_corrupt = true;
            ZF_LOG_WARN("corrupt progress value {}='{}'",
                        codec::kLastSessionDateKey, *last_date);
        }
    }

    bool const damaged = !total.present || total.corrupt || current.corrupt ||
                         longest.corrupt || sessions_count.corrupt ||
                         last_corrupt;
    if (damaged)
    {
        auto history = read_sessions();
        if (!history.sessions.empty())
        {
            ZF_LOG_INFO("rebuilding progress from {} stored sessions",
                        history.sessions.size());
            // Cleared history must not lower the monotone fields that are
            // still readable.
            auto rebuilt =
                Aggregator::replay(std::move(history.sessions), calendar_);
            rebuilt.total_minutes =
                std::max(rebuilt.total_minutes, total.value);
            rebuilt.total_sessions =
                std::max(rebuilt.total_sessions, sessions_count.value);
            rebuilt.longest_streak =
                std::max({rebuilt.longest_streak, to_streak(longest.value),
                          rebuilt.current_streak});
            return rebuilt;
        }
    }

    state.total_minutes = total.value;
    state.current_streak = to_streak(current.value);
    state.longest_streak =
        std::max(to_streak(longest.value), state.current_streak);
    state.total_sessions = sessions_count.value;
    if (last_epoch)
    {
        state.last_session_date = from_epoch_seconds(*last_epoch);
    }
    return state;
}

SessionLoad SyncGateway::load_sessions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        return {};
    }
    return read_sessions();
}

SessionLoad SyncGateway::read_sessions() const
{
    SessionLoad result;
    auto rows = database_->load_sessions();
    result.sessions.reserve(rows.size());
    for (auto const &row : rows)
    {
        if (auto session = codec::decode_session(row.payload))
        {
            result.sessions.push_back(*session);
        }
        else
        {
            ++result.skipped;
            ZF_LOG_WARN("skipping corrupt session record {}", row.row_id);
        }
    }
    return result;
}

std::vector<BadgeUnlock> SyncGateway::load_badge_unlocks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        return {};
    }
    return read_badge_unlocks();
}

std::vector<BadgeUnlock> SyncGateway::read_badge_unlocks() const
{
    auto raw = database_->get_value(codec::kBadgesKey);
    if (!raw)
    {
        return {};
    }
    auto decoded = codec::decode_badge_unlocks(*raw);
    if (!decoded)
    {
        ZF_LOG_WARN("corrupt badge list ignored");
        return {};
    }
    return std::move(*decoded);
}

bool SyncGateway::clear_sessions()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        return false;
    }
    if (!database_->delete_sessions())
    {
        ZF_LOG_ERROR("unable to clear session history");
        return false;
    }
    return true;
}

bool SyncGateway::reset_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_->is_valid())
    {
        return false;
    }
    Transaction tx(*database_);
    if (!tx.active())
    {
        ZF_LOG_ERROR("reset failed: unable to begin transaction");
        return false;
    }
    if (!database_->delete_sessions() || !database_->delete_all_values())
    {
        ZF_LOG_ERROR("reset failed: delete rejected");
        return false;
    }
    if (!tx.commit())
    {
        ZF_LOG_ERROR("reset failed: transaction not committed");
        return false;
    }
    return true;
}

} // namespace zf::engine
