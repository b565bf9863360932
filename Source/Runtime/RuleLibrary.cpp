#include "AG/Runtime/RuleLibrary.hpp"
#include "AG/Runtime/Errors.hpp"
#include "AG/Runtime/Evaluator.hpp"
#include "AG/Parser.hpp"

#include <sstream>

namespace ag {

namespace {

std::string where(const SourceLocation& loc) {
    std::ostringstream oss;
    oss << "line " << loc.line << ", col " << loc.column;
    return oss.str();
}

// Checks that every variable is bound before use and that every function
// call resolves, walking conditions in the same order the matcher does.
class RuleValidator {
public:
    RuleValidator(const Rule& rule, const FunctionRegistry& functions)
        : rule_(rule), functions_(functions) {}

    void validate() {
        for (const auto& cond : rule_.conditions) {
            if (const auto* p = std::get_if<Pattern>(&cond)) {
                checkPattern(*p, values_);
                if (p->factVar) bindFactVar(*p->factVar);
            } else if (const auto* n = std::get_if<NegatedPattern>(&cond)) {
                if (n->pattern.factVar) {
                    fail(n->loc, "negated pattern cannot bind fact variable ?" + n->pattern.factVar->name);
                }
                // Variables first seen inside a negation stay local to it
                std::set<std::string> local = values_;
                checkPattern(n->pattern, local);
            } else {
                const auto& t = std::get<TestCondition>(cond);
                checkExpr(*t.expr, "test");
            }
        }

        for (const auto& action : rule_.actions) {
            if (const auto* a = std::get_if<AssertAction>(&action)) {
                std::set<std::string> seen;
                for (const auto& attr : a->attributes) {
                    if (!seen.insert(attr.name.name).second) {
                        fail(attr.name.loc, "attribute '" + attr.name.name + "' assigned twice in assert " + a->kind.name);
                    }
                    checkExpr(*attr.value, "action");
                }
            } else {
                const auto& r = std::get<RetractAction>(action);
                if (!factVars_.count(r.factVar.name)) {
                    fail(r.loc, "retract of ?" + r.factVar.name + ", which is not bound to a fact by '<-'");
                }
            }
        }
    }

private:
    const Rule& rule_;
    const FunctionRegistry& functions_;
    std::set<std::string> values_;
    std::set<std::string> factVars_;

    [[noreturn]] void fail(const SourceLocation& loc, const std::string& msg) const {
        throw RuleLibraryError("Rule '" + rule_.name.name + "' (" + where(loc) + "): " + msg);
    }

    void checkPattern(const Pattern& p, std::set<std::string>& bound) const {
        for (const auto& c : p.constraints) {
            const auto* var = std::get_if<Variable>(&c.term);
            if (!var) continue;
            if (factVars_.count(var->name)) {
                fail(var->loc, "?" + var->name + " is bound to a fact and cannot be compared to an attribute");
            }
            if (bound.count(var->name)) continue;
            if (c.op != CompareOp::Eq) {
                fail(var->loc, "?" + var->name + " is used with '" + toString(c.op) + "' before it is bound");
            }
            bound.insert(var->name);
        }
    }

    void bindFactVar(const Variable& v) {
        if (factVars_.count(v.name) || values_.count(v.name)) {
            fail(v.loc, "?" + v.name + " is already bound");
        }
        factVars_.insert(v.name);
    }

    void checkExpr(const Expr& expr, const char* context) const {
        std::vector<Variable> vars;
        eval::collectVariables(expr, vars);
        for (const auto& v : vars) {
            if (factVars_.count(v.name)) {
                fail(v.loc, "?" + v.name + " is bound to a fact and cannot be used as a value in " + context);
            }
            if (!values_.count(v.name)) {
                fail(v.loc, std::string("unbound variable ?") + v.name + " used in " + context);
            }
        }
        std::vector<const ExprCall*> calls;
        eval::collectCalls(expr, calls);
        for (const auto* call : calls) {
            const Function* fn = functions_.find(call->func.name);
            if (!fn) fail(call->func.loc, "unknown function '" + call->func.name + "'");
            if (call->args.size() < fn->minArgs || call->args.size() > fn->maxArgs) {
                fail(call->func.loc, "wrong number of arguments to '" + call->func.name + "'");
            }
        }
    }
};

} // namespace

std::shared_ptr<const RuleLibrary> RuleLibrary::load(const Program& program, FunctionRegistry functions) {
    std::shared_ptr<RuleLibrary> lib(new RuleLibrary());
    lib->functions_ = std::move(functions);
    std::set<std::string> initialSeen;

    for (const auto& st : program.statements) {
        if (const auto* r = std::get_if<RuleDecl>(&st)) {
            if (lib->byName_.count(r->name.name)) {
                throw RuleLibraryError("Duplicate rule name '" + r->name.name + "' (" + where(r->name.loc) + ")");
            }
            RuleValidator(*r, lib->functions_).validate();
            lib->byName_.emplace(r->name.name, lib->rules_.size());
            lib->rules_.push_back(*r);
        } else if (const auto* o = std::get_if<OutputDecl>(&st)) {
            for (const auto& k : o->kinds) {
                if (lib->outputSet_.insert(k.name).second) {
                    lib->outputKinds_.push_back(k.name);
                }
            }
        } else {
            const auto& f = std::get<FactDecl>(st);
            std::set<std::string> seen;
            for (const auto& a : f.attributes) {
                if (!seen.insert(a.name.name).second) {
                    throw RuleLibraryError("Fact " + f.kind.name + " (" + where(a.name.loc) +
                                           "): attribute '" + a.name.name + "' given twice");
                }
            }
            InitialFact initial{f.kind.name, toAttributes(f)};
            if (!initialSeen.insert(factKey(initial.kind, initial.attributes)).second) {
                throw RuleLibraryError("Fact " + toString(initial.kind, initial.attributes) + " (" +
                                       where(f.loc) + ") is declared twice");
            }
            lib->initialFacts_.push_back(std::move(initial));
        }
    }
    return lib;
}

std::shared_ptr<const RuleLibrary> RuleLibrary::fromSource(std::string_view source) {
    return load(parseProgram(source));
}

std::shared_ptr<const RuleLibrary> RuleLibrary::fromFile(const std::string& path) {
    return load(parseFile(path));
}

const Rule* RuleLibrary::find(const std::string& name) const {
    auto it = byName_.find(name);
    return it == byName_.end() ? nullptr : &rules_[it->second];
}

} // namespace ag
