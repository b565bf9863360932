#pragma once

#include "AG/Runtime/ConclusionCollector.hpp"
#include "AG/Runtime/EngineConfig.hpp"
#include "AG/Runtime/FactStore.hpp"
#include "AG/Runtime/InferenceEngine.hpp"
#include "AG/Runtime/RuleLibrary.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ag {

using SessionHandle = std::uint64_t;

/**
 * @brief One advisory consultation: a private fact store plus its engine
 *
 * Observations may be asserted before a run or between runs, never during
 * one. A run that ends in CycleLimitExceeded or SessionAborted leaves the
 * session failed; every later call throws SessionError.
 */
class Session {
public:
    Session(SessionHandle handle,
            std::shared_ptr<const RuleLibrary> library,
            const EngineConfig& config,
            std::ostream* log);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionHandle handle() const { return handle_; }

    /**
     * @brief Assert an observation fact
     * @throws DuplicateFactError if the identical fact is live
     * @throws SessionError while a run is in progress or after a fatal error
     */
    FactId assertObservation(const std::string& kind, Attributes attributes);

    /**
     * @brief Drive the engine to quiescence
     * @throws CycleLimitExceeded, SessionAborted (both fatal to this session)
     * @throws SessionError when already running or failed
     */
    std::vector<Conclusion> run();

    // Request cancellation; honoured at the start of the next matching step
    void cancel() { cancelled_.store(true); }

    bool failed() const;
    EngineState state() const;

    void setDebug(bool enabled);

    // Snapshots, safe to take between runs
    std::vector<Fact> facts() const;
    std::vector<Conclusion> conclusions() const;
    std::vector<FiringRecord> firings() const;
    std::vector<SkippedAction> skippedActions() const;

private:
    std::unique_lock<std::mutex> acquire(const char* operation);
    void debugLog(const std::string& msg) const;

    SessionHandle handle_;
    std::shared_ptr<const RuleLibrary> library_;
    std::ostream* log_;
    bool debug_;

    mutable std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    bool failed_{false};
    FactStore store_;
    InferenceEngine engine_;
};

/**
 * @brief Session manager over one shared, read-only rule library
 *
 * Sessions are independent and may be driven from different threads at the
 * same time; the library is never written after load.
 */
class Advisor {
public:
    explicit Advisor(std::shared_ptr<const RuleLibrary> library,
                     EngineConfig config = EngineConfig::fromEnvironment(),
                     std::ostream* log = &std::cerr);

    // New session pre-populated with the library's initial facts
    SessionHandle startSession();

    FactId assertObservation(SessionHandle session, const std::string& kind, Attributes attributes);

    std::vector<Conclusion> run(SessionHandle session);

    void cancel(SessionHandle session);

    // Releases the session's fact store. Unknown handles throw SessionError.
    void endSession(SessionHandle session);

    // The session object, for trace inspection
    std::shared_ptr<Session> session(SessionHandle session) const;

    size_t sessionCount() const;

    const RuleLibrary& library() const { return *library_; }
    const EngineConfig& config() const { return config_; }

    void setDebug(bool enabled);
    bool debug() const;

private:
    std::shared_ptr<const RuleLibrary> library_;
    EngineConfig config_;
    std::ostream* log_;

    mutable std::mutex mutex_;
    SessionHandle next_{1};
    std::unordered_map<SessionHandle, std::shared_ptr<Session>> sessions_;
};

} // namespace ag
