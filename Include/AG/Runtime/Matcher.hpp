#pragma once

#include "AG/Runtime/Activation.hpp"
#include "AG/Runtime/FactStore.hpp"
#include "AG/Runtime/RuleLibrary.hpp"

#include <vector>

namespace ag {

/**
 * @brief Computes every activation currently satisfied by a fact store
 *
 * Each rule's conditions are joined depth-first, in order, against live
 * facts of the matching kind; bindings made by one condition are carried
 * into the next. Output order is deterministic: rules in declaration order,
 * then facts in assertion order. Every activation is recomputed on each
 * call; no partial join state is cached between calls.
 */
class Matcher {
public:
    explicit Matcher(const RuleLibrary& library) : library_(library) {}

    /**
     * @brief All activations of every rule in the library
     */
    std::vector<Activation> match(const FactStore& store) const;

    /**
     * @brief All activations of a single rule
     */
    std::vector<Activation> match(const Rule& rule, const FactStore& store) const;

    /**
     * @brief Test one pattern against one fact, extending the binding
     * @param assigned Receives the names of variables newly bound, so the
     *                 caller can roll the binding back
     * @return true if every constraint holds
     */
    static bool matchPattern(const Pattern& pattern, const Fact& fact,
                             Binding& binding, std::vector<std::string>& assigned);

private:
    const RuleLibrary& library_;
};

} // namespace ag
