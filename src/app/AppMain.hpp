#pragma once

namespace zf::app
{

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitInvalidInput = 2;

// zenflow-writer: records sessions and runs maintenance on the shared store.
int writer_main(int argc, char *argv[]);

// zenflow-widget: read-only snapshot renderer. `watch` runs until SIGINT or
// SIGTERM.
int widget_main(int argc, char *argv[]);

} // namespace zf::app
