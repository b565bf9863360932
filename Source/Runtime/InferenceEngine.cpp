#include "AG/Runtime/InferenceEngine.hpp"
#include "AG/Runtime/Errors.hpp"
#include "AG/Runtime/Evaluator.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace ag {

const char* toString(EngineState s) {
    switch (s) {
        case EngineState::Idle: return "Idle";
        case EngineState::Matching: return "Matching";
        case EngineState::Firing: return "Firing";
        case EngineState::Quiescent: return "Quiescent";
        case EngineState::CycleLimitExceeded: return "CycleLimitExceeded";
        case EngineState::Aborted: return "Aborted";
    }
    return "Unknown";
}

InferenceEngine::InferenceEngine(std::shared_ptr<const RuleLibrary> library,
                                 FactStore& store,
                                 EngineConfig config,
                                 std::ostream* log)
    : library_(std::move(library))
    , store_(store)
    , config_(config)
    , log_(log)
    , matcher_(*library_)
    , collector_(*library_)
{}

std::vector<Conclusion> InferenceEngine::run(const std::atomic<bool>* cancel) {
    if (state_ == EngineState::CycleLimitExceeded || state_ == EngineState::Aborted) {
        throw SessionError(std::string("Cannot run an engine in state ") + toString(state_));
    }

    cycles_ = 0;
    while (true) {
        state_ = EngineState::Matching;
        if (cancel && cancel->load()) {
            state_ = EngineState::Aborted;
            throw SessionAborted("Run cancelled after " + std::to_string(cycles_) + " cycle(s)");
        }

        std::vector<Activation> candidates = matcher_.match(store_);

        // Refraction lasts only while an activation stays matched; one that
        // left the conflict set and re-entered it may fire again
        std::set<ActivationKey> matched;
        for (const auto& a : candidates) matched.emplace(a.rule->name.name, a.facts);
        for (auto it = fired_.begin(); it != fired_.end();) {
            it = matched.count(*it) ? std::next(it) : fired_.erase(it);
        }

        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [this](const Activation& a) {
                                            return fired_.count(ActivationKey(a.rule->name.name, a.facts)) != 0;
                                        }),
                         candidates.end());

        if (candidates.empty()) {
            state_ = EngineState::Quiescent;
            if (config_.debug) {
                debugLog("Quiescent after " + std::to_string(cycles_) + " cycle(s), " +
                         std::to_string(store_.size()) + " live fact(s)");
            }
            return collector_.collect(store_);
        }

        if (cycles_ >= config_.maxCycles) {
            state_ = EngineState::CycleLimitExceeded;
            std::ostringstream oss;
            oss << "Cycle limit of " << config_.maxCycles << " exceeded; last firings:";
            auto recent = recentFirings();
            for (const auto& r : recent) oss << ' ' << toString(r) << ';';
            throw CycleLimitExceeded(oss.str(), config_.maxCycles, std::move(recent));
        }

        state_ = EngineState::Firing;
        if (config_.debug) {
            debugLog(std::to_string(candidates.size()) + " activation(s) eligible");
        }
        fire(resolver_.select(candidates));
        ++cycles_;
    }
}

void InferenceEngine::fire(const Activation& activation) {
    const Rule& rule = *activation.rule;
    fired_.emplace(rule.name.name, activation.facts);
    firings_.push_back({firings_.size() + 1, rule.name.name, activation.facts});

    if (config_.debug) {
        debugLog("Firing " + toString(activation));
    }

    for (const auto& action : rule.actions) {
        if (const auto* a = std::get_if<AssertAction>(&action)) {
            applyAssert(*a, activation);
        } else {
            applyRetract(std::get<RetractAction>(action), activation);
        }
    }
}

void InferenceEngine::applyAssert(const AssertAction& action, const Activation& activation) {
    Attributes attrs;
    for (const auto& attr : action.attributes) {
        auto v = eval::evaluate(*attr.value, activation.binding, library_->functions());
        if (!v) {
            skip(activation, "assert " + action.kind.name + ": cannot evaluate attribute '" +
                             attr.name.name + "' = " + toString(*attr.value));
            return;
        }
        attrs.emplace(attr.name.name, std::move(*v));
    }

    try {
        FactId id = store_.assertFact(action.kind.name, std::move(attrs));
        if (config_.debug) {
            debugLog("  asserted f-" + std::to_string(id) + " " + toString(*store_.get(id)));
        }
    } catch (const DuplicateFactError& e) {
        skip(activation, e.what());
    }
}

void InferenceEngine::applyRetract(const RetractAction& action, const Activation& activation) {
    auto it = activation.binding.facts.find(action.factVar.name);
    if (it == activation.binding.facts.end()) {
        skip(activation, "retract ?" + action.factVar.name + ": variable not bound to a fact");
        return;
    }
    try {
        store_.retract(it->second);
        if (config_.debug) {
            debugLog("  retracted f-" + std::to_string(it->second));
        }
    } catch (const UnknownFactError& e) {
        skip(activation, e.what());
    }
}

void InferenceEngine::skip(const Activation& activation, const std::string& reason) {
    skipped_.push_back({firings_.size(), activation.rule->name.name, reason});
    if (config_.debug) {
        debugLog("  skipped action: " + reason);
    }
}

std::vector<FiringRecord> InferenceEngine::recentFirings() const {
    const size_t n = std::min(config_.traceDepth, firings_.size());
    return std::vector<FiringRecord>(firings_.end() - static_cast<std::ptrdiff_t>(n), firings_.end());
}

void InferenceEngine::debugLog(const std::string& msg) const {
    if (config_.debug && log_) {
        (*log_) << "[InferenceEngine] " << msg << std::endl;
    }
}

} // namespace ag
