#include "AG/Runtime/Matcher.hpp"
#include "AG/Runtime/Evaluator.hpp"

#include <functional>
#include <iterator>

namespace ag {

bool Matcher::matchPattern(const Pattern& pattern, const Fact& fact,
                           Binding& binding, std::vector<std::string>& assigned) {
    if (fact.kind != pattern.kind.name) return false;
    for (const auto& c : pattern.constraints) {
        const Value* actual = fact.find(c.attribute.name);
        if (!actual) return false; // constraint on an absent attribute fails

        if (const auto* var = std::get_if<Variable>(&c.term)) {
            auto it = binding.values.find(var->name);
            if (it == binding.values.end()) {
                // Only equality can introduce a binding; the library
                // rejects anything else at load time
                if (c.op != CompareOp::Eq) return false;
                binding.values.emplace(var->name, *actual);
                assigned.push_back(var->name);
                continue;
            }
            if (!compareValues(c.op, *actual, it->second)) return false;
        } else if (!compareValues(c.op, *actual, std::get<Value>(c.term))) {
            return false;
        }
    }
    return true;
}

std::vector<Activation> Matcher::match(const FactStore& store) const {
    std::vector<Activation> out;
    for (const auto& rule : library_.rules()) {
        auto acts = match(rule, store);
        out.insert(out.end(), std::make_move_iterator(acts.begin()), std::make_move_iterator(acts.end()));
    }
    return out;
}

std::vector<Activation> Matcher::match(const Rule& rule, const FactStore& store) const {
    std::vector<Activation> out;
    const FunctionRegistry& functions = library_.functions();

    Binding binding;
    std::vector<FactId> matched;

    auto rollback = [&binding](const std::vector<std::string>& assigned) {
        for (const auto& vn : assigned) binding.values.erase(vn);
    };

    // Depth-first join over the rule's conditions
    std::function<void(size_t)> dfs = [&](size_t idx) {
        if (idx == rule.conditions.size()) {
            Activation a;
            a.rule = &rule;
            a.binding = binding;
            a.facts = matched;
            out.push_back(std::move(a));
            return;
        }

        const Condition& cond = rule.conditions[idx];

        if (const auto* p = std::get_if<Pattern>(&cond)) {
            for (const auto& fact : store.query(p->kind.name)) {
                std::vector<std::string> assigned;
                if (matchPattern(*p, fact, binding, assigned)) {
                    matched.push_back(fact.id);
                    if (p->factVar) binding.facts[p->factVar->name] = fact.id;
                    dfs(idx + 1);
                    if (p->factVar) binding.facts.erase(p->factVar->name);
                    matched.pop_back();
                }
                rollback(assigned);
            }
            return;
        }

        if (const auto* n = std::get_if<NegatedPattern>(&cond)) {
            // Holds when no live fact matches under the current binding
            for (const auto& fact : store.query(n->pattern.kind.name)) {
                std::vector<std::string> assigned;
                const bool hit = matchPattern(n->pattern, fact, binding, assigned);
                rollback(assigned);
                if (hit) return;
            }
            dfs(idx + 1);
            return;
        }

        const auto& t = std::get<TestCondition>(cond);
        if (eval::evaluateTest(*t.expr, binding, functions)) {
            dfs(idx + 1);
        }
    };

    dfs(0);
    return out;
}

} // namespace ag
