#include "interrupt.hpp"
#include <signal.h>
#include <cstring>

namespace agentsh {

static std::atomic<bool> g_interrupted{false};

static void interrupt_handler(int /*sig*/) {
    g_interrupted.store(true);
}

void install_interrupt_handler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
}

const std::atomic<bool>& interrupt_flag() {
    return g_interrupted;
}

bool interrupt_requested() {
    return g_interrupted.load();
}

void clear_interrupt() {
    g_interrupted.store(false);
}

void raise_interrupt() {
    g_interrupted.store(true);
}

} // namespace agentsh
