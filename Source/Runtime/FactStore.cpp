#include "AG/Runtime/FactStore.hpp"
#include "AG/Runtime/Errors.hpp"

namespace ag {

void FactStore::Query::iterator::settle() {
    current_ = nullptr;
    while (it_ != query_->ids_->end()) {
        const Fact& f = query_->store_->facts_.at(*it_);
        if (!query_->pred_ || query_->pred_(f)) {
            current_ = &f;
            return;
        }
        ++it_;
    }
}

FactId FactStore::assertFact(const std::string& kind, Attributes attributes) {
    std::string k = factKey(kind, attributes);
    auto existing = index_.find(k);
    if (existing != index_.end()) {
        throw DuplicateFactError("Fact already asserted: " + toString(kind, attributes) +
                                 " (f-" + std::to_string(existing->second) + ")",
                                 existing->second);
    }

    const FactId id = nextId_++;
    Fact f;
    f.id = id;
    f.kind = kind;
    f.attributes = std::move(attributes);
    facts_.emplace(id, std::move(f));
    byKind_[kind].insert(id);
    index_.emplace(std::move(k), id);
    return id;
}

void FactStore::retract(FactId id) {
    auto it = facts_.find(id);
    if (it == facts_.end()) {
        throw UnknownFactError("No live fact with id f-" + std::to_string(id), id);
    }
    const Fact& f = it->second;
    index_.erase(factKey(f.kind, f.attributes));
    auto kindIt = byKind_.find(f.kind);
    if (kindIt != byKind_.end()) {
        kindIt->second.erase(id);
    }
    facts_.erase(it);
}

FactStore::Query FactStore::query(const std::string& kind, Predicate pred) const {
    static const std::set<FactId> kEmpty;
    auto it = byKind_.find(kind);
    const std::set<FactId>& ids = it == byKind_.end() ? kEmpty : it->second;
    return Query(*this, ids, std::move(pred));
}

const Fact* FactStore::get(FactId id) const {
    auto it = facts_.find(id);
    return it == facts_.end() ? nullptr : &it->second;
}

FactId FactStore::find(const std::string& kind, const Attributes& attributes) const {
    auto it = index_.find(factKey(kind, attributes));
    return it == index_.end() ? 0 : it->second;
}

std::vector<Fact> FactStore::facts() const {
    std::vector<Fact> out;
    out.reserve(facts_.size());
    for (const auto& [id, f] : facts_) out.push_back(f);
    return out;
}

} // namespace ag
