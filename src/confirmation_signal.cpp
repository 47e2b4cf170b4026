#include "confirmation_signal.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace portguard {

namespace {
// The only state reachable from the handler: the flag of the active run
std::atomic<std::atomic<bool>*> g_active_flag{nullptr};

static_assert(std::atomic<std::atomic<bool>*>::is_always_lock_free,
              "signal handler needs a lock-free pointer");
}

ConfirmationSignal::ConfirmationSignal(std::atomic<bool>& confirmed) {
    std::atomic<bool>* expected = nullptr;
    if (!g_active_flag.compare_exchange_strong(expected, &confirmed)) {
        throw std::runtime_error("Confirmation handler is already installed");
    }

    struct sigaction action {};
    action.sa_handler = &ConfirmationSignal::handle;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(SIGINT, &action, &previous_int_) != 0) {
        const std::string reason = std::strerror(errno);
        g_active_flag.store(nullptr);
        throw std::runtime_error("Failed to install SIGINT handler: " + reason);
    }
    if (sigaction(SIGTERM, &action, &previous_term_) != 0) {
        const std::string reason = std::strerror(errno);
        if (sigaction(SIGINT, &previous_int_, nullptr) != 0) {
            Logger::warning("ConfirmationSignal", "Could not restore previous SIGINT handler");
        }
        g_active_flag.store(nullptr);
        throw std::runtime_error("Failed to install SIGTERM handler: " + reason);
    }

    Logger::debug("ConfirmationSignal", "SIGINT/SIGTERM handlers installed");
}

ConfirmationSignal::~ConfirmationSignal() {
    bool restored = sigaction(SIGTERM, &previous_term_, nullptr) == 0;
    restored = sigaction(SIGINT, &previous_int_, nullptr) == 0 && restored;
    g_active_flag.store(nullptr);
    if (!restored) {
        Logger::warning("ConfirmationSignal", "Could not restore previous signal handlers");
    }
}

void ConfirmationSignal::handle(int /*signum*/) {
    std::atomic<bool>* flag = g_active_flag.load();
    if (flag != nullptr) {
        flag->store(true);
    }
}

} // namespace portguard
