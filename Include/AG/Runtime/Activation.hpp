#pragma once

#include "AG/AST.hpp"
#include "AG/core.hpp"

#include <map>
#include <string>
#include <vector>

namespace ag {

using Rule = RuleDecl;

/**
 * @brief Variable bindings produced while matching one rule
 *
 * `values` holds ?var bindings taken from fact attributes, `facts` holds
 * fact-address bindings (?f <- kind(...)).
 */
struct Binding {
    std::map<std::string, Value> values;
    std::map<std::string, FactId> facts;
};

/**
 * @brief A rule paired with a binding that currently satisfies it
 */
struct Activation {
    const Rule* rule{nullptr};
    Binding binding;
    // Fact-ids matched by the rule's positive patterns, in condition order
    std::vector<FactId> facts;

    // Largest matched fact-id, 0 if the rule matched no fact
    FactId mostRecentFact() const;
};

// One entry of the firing log kept by the inference engine
struct FiringRecord {
    size_t cycle{0};
    std::string rule;
    std::vector<FactId> facts;
};

std::string toString(const Activation& a);
std::string toString(const FiringRecord& r);

} // namespace ag
