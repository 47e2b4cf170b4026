/**
 * @file confirmation_signal.hpp
 * @brief SIGINT/SIGTERM as the operator's "keep the change" signal
 * @author portguard Development Team
 * @date 2024
 */

#pragma once

#include <atomic>
#include <csignal>

namespace portguard {

/**
 * @class ConfirmationSignal
 * @brief Scoped installation of the confirmation signal handlers
 *
 * While an instance is alive, SIGINT and SIGTERM store `true` into the
 * flag passed to the constructor and do nothing else. The previous
 * handlers are put back by the destructor. Only one instance may be alive
 * at a time.
 */
class ConfirmationSignal {
public:
    /**
     * @brief Install the handlers
     * @param confirmed Flag owned by the current run
     * @throws std::runtime_error if sigaction fails or another instance is active
     */
    explicit ConfirmationSignal(std::atomic<bool>& confirmed);
    ~ConfirmationSignal();

    ConfirmationSignal(const ConfirmationSignal&) = delete;
    ConfirmationSignal& operator=(const ConfirmationSignal&) = delete;

private:
    static void handle(int signum);

    struct sigaction previous_int_;
    struct sigaction previous_term_;
};

} // namespace portguard
