#include "ringframe/stop_signal.hpp"

namespace ringframe {
namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_stop_signal(int /*signum*/) {
    g_stop_requested = 1;
}

}  // namespace

StopSignal::StopSignal() noexcept {
    g_stop_requested = 0;
    previous_int_ = std::signal(SIGINT, on_stop_signal);
    previous_term_ = std::signal(SIGTERM, on_stop_signal);
}

StopSignal::~StopSignal() {
    std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
}

bool StopSignal::requested() const noexcept {
    return g_stop_requested != 0;
}

}  // namespace ringframe
