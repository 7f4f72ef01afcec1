#include "interrupt.hpp"

namespace vaultup::infra {

std::atomic<bool> g_interrupted{false};

namespace {

void on_signal(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

} // namespace vaultup::infra
