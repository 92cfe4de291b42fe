#pragma once

namespace zf::runtime
{

// Process-wide stop flag for the widget watch loop. Safe to call from a
// signal handler.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;
void install_signal_handlers();

} // namespace zf::runtime
