#pragma once

#include "AG/Runtime/Activation.hpp"
#include "AG/Runtime/ConclusionCollector.hpp"
#include "AG/Runtime/ConflictResolver.hpp"
#include "AG/Runtime/EngineConfig.hpp"
#include "AG/Runtime/FactStore.hpp"
#include "AG/Runtime/Matcher.hpp"
#include "AG/Runtime/RuleLibrary.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ag {

enum class EngineState {
    Idle,
    Matching,
    Firing,
    Quiescent,           // terminal: no activation left
    CycleLimitExceeded,  // terminal: fatal to the session
    Aborted              // terminal: cancelled between cycles
};

const char* toString(EngineState s);

// An action that could not be applied while firing a rule
struct SkippedAction {
    // Number of the firing it belongs to, counted since the engine was
    // created (FiringRecord::cycle)
    size_t firing{0};
    std::string rule;
    std::string reason;
};

/**
 * @brief Forward-chaining driver for one session
 *
 * Repeats match -> resolve -> fire, one activation per cycle, until no
 * activation remains. An activation (rule, matched facts) fires at most
 * once while it stays matched (refraction), so a rule never re-fires on the
 * facts that already triggered it. An activation that stops matching, for
 * example because a negated fact appeared, becomes eligible again once it
 * matches anew.
 *
 * Actions are applied best-effort in declared order: a duplicate assertion
 * or a retraction of a fact that is no longer live is recorded as a
 * SkippedAction and the remaining actions still run.
 */
class InferenceEngine {
public:
    /**
     * @param library Shared rule library
     * @param store Working memory, owned by the caller for the engine's lifetime
     * @param config Cycle ceiling, trace depth and debug flag
     * @param log Destination for debug logging
     */
    InferenceEngine(std::shared_ptr<const RuleLibrary> library,
                    FactStore& store,
                    EngineConfig config = {},
                    std::ostream* log = &std::cerr);

    /**
     * @brief Run to quiescence
     * @param cancel Checked at the top of every matching step; when set the
     *               run stops with SessionAborted
     * @return Conclusions present in the store at quiescence
     * @throws CycleLimitExceeded, SessionAborted
     */
    std::vector<Conclusion> run(const std::atomic<bool>* cancel = nullptr);

    EngineState state() const { return state_; }

    // Firings in the last run
    size_t cycles() const { return cycles_; }

    // Every firing since the engine was created, in order
    const std::vector<FiringRecord>& firings() const { return firings_; }

    const std::vector<SkippedAction>& skippedActions() const { return skipped_; }

    const EngineConfig& config() const { return config_; }

    void setDebug(bool enabled) { config_.debug = enabled; }
    bool debug() const { return config_.debug; }

private:
    using ActivationKey = std::pair<std::string, std::vector<FactId>>;

    void fire(const Activation& activation);
    void applyAssert(const AssertAction& action, const Activation& activation);
    void applyRetract(const RetractAction& action, const Activation& activation);
    void skip(const Activation& activation, const std::string& reason);
    std::vector<FiringRecord> recentFirings() const;

    void debugLog(const std::string& msg) const;

    std::shared_ptr<const RuleLibrary> library_;
    FactStore& store_;
    EngineConfig config_;
    std::ostream* log_;

    Matcher matcher_;
    ConflictResolver resolver_;
    ConclusionCollector collector_;

    EngineState state_{EngineState::Idle};
    size_t cycles_{0};
    std::set<ActivationKey> fired_;
    std::vector<FiringRecord> firings_;
    std::vector<SkippedAction> skipped_;
};

} // namespace ag
