#include "AG/Runtime/ConflictResolver.hpp"

#include <algorithm>
#include <stdexcept>

namespace ag {

bool ConflictResolver::precedes(const Activation& a, const Activation& b) {
    if (a.rule->priority != b.rule->priority) {
        return a.rule->priority > b.rule->priority;
    }
    const FactId ra = a.mostRecentFact();
    const FactId rb = b.mostRecentFact();
    if (ra != rb) {
        return ra < rb;
    }
    if (a.rule->name.name != b.rule->name.name) {
        return a.rule->name.name < b.rule->name.name;
    }
    return a.facts < b.facts;
}

const Activation& ConflictResolver::select(const std::vector<Activation>& candidates) const {
    if (candidates.empty()) {
        throw std::invalid_argument("ConflictResolver::select called with no candidates");
    }
    return *std::min_element(candidates.begin(), candidates.end(), &ConflictResolver::precedes);
}

std::vector<Activation> ConflictResolver::order(std::vector<Activation> candidates) const {
    std::stable_sort(candidates.begin(), candidates.end(), &ConflictResolver::precedes);
    return candidates;
}

} // namespace ag
