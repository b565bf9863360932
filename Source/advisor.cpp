#include "AG/advisor.hpp"
#include "AG/Runtime/Errors.hpp"

namespace ag {

// -------- Session --------

Session::Session(SessionHandle handle,
                 std::shared_ptr<const RuleLibrary> library,
                 const EngineConfig& config,
                 std::ostream* log)
    : handle_(handle)
    , library_(std::move(library))
    , log_(log)
    , debug_(config.debug)
    , engine_(library_, store_, config, log)
{
    // Initial facts are unique; the library rejects duplicates at load
    for (const auto& f : library_->initialFacts()) {
        store_.assertFact(f.kind, f.attributes);
    }
    debugLog("started with " + std::to_string(store_.size()) + " initial fact(s)");
}

std::unique_lock<std::mutex> Session::acquire(const char* operation) {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        throw SessionError(std::string("Session ") + std::to_string(handle_) + ": cannot " +
                           operation + " while a run is in progress");
    }
    if (failed_) {
        throw SessionError(std::string("Session ") + std::to_string(handle_) + ": cannot " +
                           operation + " after a fatal error");
    }
    return lock;
}

FactId Session::assertObservation(const std::string& kind, Attributes attributes) {
    auto lock = acquire("assert an observation");
    FactId id = store_.assertFact(kind, std::move(attributes));
    debugLog("observation f-" + std::to_string(id) + " " + toString(*store_.get(id)));
    return id;
}

std::vector<Conclusion> Session::run() {
    auto lock = acquire("run");
    try {
        auto conclusions = engine_.run(&cancelled_);
        debugLog("run finished with " + std::to_string(conclusions.size()) + " conclusion(s)");
        return conclusions;
    } catch (const CycleLimitExceeded& e) {
        failed_ = true;
        debugLog(e.what());
        throw;
    } catch (const SessionAborted& e) {
        failed_ = true;
        debugLog(e.what());
        throw;
    }
}

bool Session::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

EngineState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.state();
}

void Session::setDebug(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_ = enabled;
    engine_.setDebug(enabled);
}

std::vector<Fact> Session::facts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.facts();
}

std::vector<Conclusion> Session::conclusions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ConclusionCollector(*library_).collect(store_);
}

std::vector<FiringRecord> Session::firings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.firings();
}

std::vector<SkippedAction> Session::skippedActions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.skippedActions();
}

void Session::debugLog(const std::string& msg) const {
    if (debug_ && log_) {
        (*log_) << "[Session " << handle_ << "] " << msg << std::endl;
    }
}

// -------- Advisor --------

Advisor::Advisor(std::shared_ptr<const RuleLibrary> library, EngineConfig config, std::ostream* log)
    : library_(std::move(library))
    , config_(config)
    , log_(log)
{
    if (!library_) {
        throw SessionError("Advisor requires a rule library");
    }
}

SessionHandle Advisor::startSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    const SessionHandle h = next_++;
    sessions_.emplace(h, std::make_shared<Session>(h, library_, config_, log_));
    return h;
}

std::shared_ptr<Session> Advisor::session(SessionHandle session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
        throw SessionError("Unknown session " + std::to_string(session));
    }
    return it->second;
}

FactId Advisor::assertObservation(SessionHandle session, const std::string& kind, Attributes attributes) {
    // The table lock is released before touching the session so that
    // sessions never wait on each other
    return this->session(session)->assertObservation(kind, std::move(attributes));
}

std::vector<Conclusion> Advisor::run(SessionHandle session) {
    return this->session(session)->run();
}

void Advisor::cancel(SessionHandle session) {
    this->session(session)->cancel();
}

void Advisor::endSession(SessionHandle session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session) == 0) {
        throw SessionError("Unknown session " + std::to_string(session));
    }
}

size_t Advisor::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void Advisor::setDebug(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.debug = enabled;
}

bool Advisor::debug() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.debug;
}

} // namespace ag
