#pragma once

#include "engine/Calendar.hpp"
#include "engine/Progress.hpp"

#include <vector>

namespace zf::engine
{

// Pure folding rules from sessions to AggregateState. Holds no state; the
// writer-side ProgressService owns serialization and persistence.
class Aggregator
{
  public:
    // Folds one session into `state`. The caller validates the duration.
    static AggregateState apply(AggregateState state, Session const &session,
                                Calendar const &calendar);

    // Rebuilds from empty state, folding `sessions` in timestamp order
    // (stable for equal timestamps).
    static AggregateState replay(std::vector<Session> sessions,
                                 Calendar const &calendar);

    // Streak still alive at `now`: last session today or yesterday.
    static bool is_streak_active(AggregateState const &state, Instant now,
                                 Calendar const &calendar);
};

} // namespace zf::engine
