#include "AG/Runtime/ConclusionCollector.hpp"

namespace ag {

std::vector<Conclusion> ConclusionCollector::collect(const FactStore& store) const {
    std::vector<Conclusion> out;
    for (const auto& fact : store.facts()) {
        if (library_.isOutputKind(fact.kind)) {
            out.push_back(fact);
        }
    }
    return out;
}

std::vector<Conclusion> ConclusionCollector::ofKind(const std::vector<Conclusion>& conclusions,
                                                    const std::string& kind) {
    std::vector<Conclusion> out;
    for (const auto& c : conclusions) {
        if (c.kind == kind) out.push_back(c);
    }
    return out;
}

} // namespace ag
