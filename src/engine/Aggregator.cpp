#include "engine/Aggregator.hpp"

#include <algorithm>

namespace zf::engine
{

AggregateState Aggregator::apply(AggregateState state, Session const &session,
                                 Calendar const &calendar)
{
    state.total_minutes += std::max<std::int64_t>(session.duration_minutes, 0);
    state.total_sessions += 1;

    if (!state.last_session_date)
    {
        state.current_streak = 1;
    }
    else
    {
        auto const gap =
            calendar.days_between(*state.last_session_date, session.timestamp);
        if (gap == 1)
        {
            state.current_streak += 1;
        }
        else if (gap != 0)
        {
            // two or more days apart, or earlier than the last session;
            // same-day sessions leave the streak alone
            state.current_streak = 1;
        }
    }

    state.longest_streak = std::max(state.longest_streak, state.current_streak);
    state.last_session_date = session.timestamp;
    return state;
}

AggregateState Aggregator::replay(std::vector<Session> sessions,
                                  Calendar const &calendar)
{
    std::stable_sort(sessions.begin(), sessions.end(),
                     [](Session const &lhs, Session const &rhs)
                     { return lhs.timestamp < rhs.timestamp; });
    AggregateState state;
    for (auto const &session : sessions)
    {
        state = apply(state, session, calendar);
    }
    return state;
}

bool Aggregator::is_streak_active(AggregateState const &state, Instant now,
                                  Calendar const &calendar)
{
    if (!state.last_session_date)
    {
        return false;
    }
    return calendar.days_between(*state.last_session_date, now) <= 1;
}

} // namespace zf::engine
