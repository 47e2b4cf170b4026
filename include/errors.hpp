/**
 * @file errors.hpp
 * @brief Exception hierarchy for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * Every failure that aborts a phase of a guarded change is reported as one
 * of the exceptions below. They all derive from GuardError, which derives
 * from std::runtime_error, so callers that only care about "something went
 * wrong" can catch the standard type.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace portguard {

/**
 * @class GuardError
 * @brief Base class of all portguard errors
 */
class GuardError : public std::runtime_error {
public:
    explicit GuardError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class PreconditionFailure
 * @brief The host is not in the state required to start a guarded change
 *
 * Raised before any side effect. Carries every problem that was observed
 * so the operator can fix them all in one pass.
 */
class PreconditionFailure : public GuardError {
public:
    explicit PreconditionFailure(std::vector<std::string> problems)
        : GuardError(buildMessage(problems))
        , problems_(std::move(problems)) {}

    const std::vector<std::string>& problems() const { return problems_; }

private:
    static std::string buildMessage(const std::vector<std::string>& problems) {
        std::string message = "Precondition check failed";
        if (!problems.empty()) {
            message += ": " + problems.front();
            if (problems.size() > 1) {
                message += " (and " + std::to_string(problems.size() - 1) + " more)";
            }
        }
        return message;
    }

    std::vector<std::string> problems_;
};

/**
 * @class FormatError
 * @brief Chain listing text does not have the expected shape
 *
 * The listing parser is strict: any line it does not understand is treated
 * as schema drift and reported with this exception.
 */
class FormatError : public GuardError {
public:
    explicit FormatError(const std::string& message)
        : GuardError(message) {}
};

/**
 * @class ApplyFailure
 * @brief A single change item could not be applied
 */
class ApplyFailure : public GuardError {
public:
    explicit ApplyFailure(const std::string& message)
        : GuardError(message) {}
};

/**
 * @class BackupError
 * @brief The pre-change snapshot could not be written
 */
class BackupError : public GuardError {
public:
    explicit BackupError(const std::string& message)
        : GuardError(message) {}
};

/**
 * @class RollbackFailure
 * @brief A rollback step exhausted its attempts
 *
 * Recorded in the rollback report rather than propagated; the escalation
 * continues with the next strategy.
 */
class RollbackFailure : public GuardError {
public:
    explicit RollbackFailure(const std::string& message)
        : GuardError(message) {}
};

} // namespace portguard
