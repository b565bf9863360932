#pragma once

#include "AG/Runtime/Activation.hpp"
#include "AG/core.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace ag {

/**
 * @brief Malformed or contradictory rule definitions; raised while loading
 * a rule library, never during a session
 */
class RuleLibraryError : public std::runtime_error {
public:
    explicit RuleLibraryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief An identical (kind, attributes) fact is already live
 */
class DuplicateFactError : public std::runtime_error {
public:
    DuplicateFactError(const std::string& msg, FactId existing)
        : std::runtime_error(msg), existing_(existing) {}

    FactId existing() const { return existing_; }

private:
    FactId existing_;
};

/**
 * @brief Retraction of a fact-id that is not live
 */
class UnknownFactError : public std::runtime_error {
public:
    UnknownFactError(const std::string& msg, FactId id)
        : std::runtime_error(msg), id_(id) {}

    FactId id() const { return id_; }

private:
    FactId id_;
};

/**
 * @brief A run exceeded the configured cycle ceiling
 *
 * Carries the most recent firings to help debug oscillating rule sets.
 */
class CycleLimitExceeded : public std::runtime_error {
public:
    CycleLimitExceeded(const std::string& msg, size_t limit, std::vector<FiringRecord> recent)
        : std::runtime_error(msg), limit_(limit), recent_(std::move(recent)) {}

    size_t limit() const { return limit_; }
    const std::vector<FiringRecord>& recentFirings() const { return recent_; }

private:
    size_t limit_;
    std::vector<FiringRecord> recent_;
};

/**
 * @brief A run was cancelled between cycles
 */
class SessionAborted : public std::runtime_error {
public:
    explicit SessionAborted(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Misuse of the session API (unknown handle, assertion during a run,
 * use of a session after a fatal error)
 */
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace ag
