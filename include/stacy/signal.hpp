#pragma once

#include <stacy/result.hpp>

namespace stacy {

// SIGINT/SIGTERM/SIGQUIT set a process-wide cancellation flag. Workers
// poll it; each runner signals and reaps its own child process group.
void install_signal_handlers() noexcept;

void notify_cancel() noexcept;
void reset_cancelled() noexcept;
bool is_cancelled() noexcept;

// Signal that triggered cancellation, 0 when not cancelled
int cancel_signal() noexcept;

// Cancelled error once the flag is set
Status cancellation_point();

} // namespace stacy
