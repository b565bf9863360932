#include "AG/Runtime/Activation.hpp"

#include <algorithm>
#include <sstream>

namespace ag {

FactId Activation::mostRecentFact() const {
    if (facts.empty()) return 0;
    return *std::max_element(facts.begin(), facts.end());
}

static void writeFactIds(std::ostringstream& oss, const std::vector<FactId>& ids) {
    oss << '[';
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) oss << ", ";
        oss << "f-" << ids[i];
    }
    oss << ']';
}

std::string toString(const Activation& a) {
    std::ostringstream oss;
    oss << (a.rule ? a.rule->name.name : std::string("<none>")) << ' ';
    writeFactIds(oss, a.facts);
    if (!a.binding.values.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [name, value] : a.binding.values) {
            if (!first) oss << ", ";
            first = false;
            oss << '?' << name << '=' << value.toLiteral();
        }
        oss << '}';
    }
    return oss.str();
}

std::string toString(const FiringRecord& r) {
    std::ostringstream oss;
    oss << '#' << r.cycle << ' ' << r.rule << ' ';
    writeFactIds(oss, r.facts);
    return oss.str();
}

} // namespace ag
