#include "solo/signals.hpp"

#include <csignal>
#include <cstring>

namespace solo {

namespace {

volatile std::sig_atomic_t g_requested = 0;
volatile std::sig_atomic_t g_signal = 0;

extern "C" void onShutdownSignal(int signum) {
    g_signal = signum;
    g_requested = 1;
}

} // namespace

void ShutdownSignal::install() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onShutdownSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
}

bool ShutdownSignal::requested() {
    return g_requested != 0;
}

int ShutdownSignal::lastSignal() {
    return g_signal;
}

void ShutdownSignal::request(int signum) {
    g_signal = signum;
    g_requested = 1;
}

void ShutdownSignal::reset() {
    g_signal = 0;
    g_requested = 0;
}

} // namespace solo
