#include <stacy/signal.hpp>

#include <atomic>
#include <csignal>

namespace {

std::atomic<int> got_signal{0};

void handle_signal(int sig) { got_signal.store(sig); }

}  // namespace

namespace stacy {

void notify_cancel() noexcept { got_signal.store(SIGINT); }
void reset_cancelled() noexcept { got_signal.store(0); }

void install_signal_handlers() noexcept {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

#ifdef SIGQUIT
    std::signal(SIGQUIT, handle_signal);
#endif

#ifdef SIGPIPE
    // Output piped into a closed reader must not kill the tool mid-run
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

bool is_cancelled() noexcept { return got_signal.load() != 0; }
int cancel_signal() noexcept { return got_signal.load(); }

Status cancellation_point() {
    if (is_cancelled()) {
        return StacyError{StacyError::Cancelled, "interrupted"};
    }
    return ok_status();
}

} // namespace stacy
