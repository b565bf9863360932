#include "AG/AST.hpp"
#include <sstream>

namespace ag {

std::string toString(const Expr& e) {
    struct V {
        std::string operator()(const ExprLiteral& n) const { return n.value.toLiteral(); }
        std::string operator()(const ExprVariable& v) const { return "?" + v.var.name; }
        std::string operator()(const ExprParen& p) const { return '(' + toString(*p.inner) + ')'; }
        std::string operator()(const ExprCall& c) const {
            std::ostringstream oss; oss << c.func.name << '(';
            for (size_t i = 0; i < c.args.size(); ++i) {
                if (i) oss << ",";
                oss << toString(*c.args[i]);
            }
            oss << ')';
            return oss.str();
        }
        std::string operator()(const ExprBinary& b) const {
            switch (b.op) {
                case ExprBinary::Op::Add: return toString(*b.lhs) + "+" + toString(*b.rhs);
                case ExprBinary::Op::Sub: return toString(*b.lhs) + "-" + toString(*b.rhs);
                case ExprBinary::Op::Mul: return toString(*b.lhs) + "*" + toString(*b.rhs);
                case ExprBinary::Op::Div: return toString(*b.lhs) + "/" + toString(*b.rhs);
                case ExprBinary::Op::Lt: return toString(*b.lhs) + "<" + toString(*b.rhs);
                case ExprBinary::Op::Le: return toString(*b.lhs) + "<=" + toString(*b.rhs);
                case ExprBinary::Op::Gt: return toString(*b.lhs) + ">" + toString(*b.rhs);
                case ExprBinary::Op::Ge: return toString(*b.lhs) + ">=" + toString(*b.rhs);
                case ExprBinary::Op::Eq: return toString(*b.lhs) + "==" + toString(*b.rhs);
                case ExprBinary::Op::Ne: return toString(*b.lhs) + "!=" + toString(*b.rhs);
                case ExprBinary::Op::And: return toString(*b.lhs) + " and " + toString(*b.rhs);
                case ExprBinary::Op::Or: return toString(*b.lhs) + " or " + toString(*b.rhs);
            }
            return toString(*b.lhs) + toString(*b.rhs);
        }
        std::string operator()(const ExprUnary& u) const {
            switch (u.op) {
                case ExprUnary::Op::Neg: return "-" + toString(*u.operand);
                case ExprUnary::Op::Not: return "not " + toString(*u.operand);
            }
            return toString(*u.operand);
        }
    } v;
    return std::visit(v, e.node);
}

std::string toString(const Term& t) {
    if (const auto* var = std::get_if<Variable>(&t)) return "?" + var->name;
    return std::get<Value>(t).toLiteral();
}

std::string toString(const Pattern& p) {
    std::ostringstream oss;
    if (p.factVar) oss << "?" << p.factVar->name << " <- ";
    oss << p.kind.name << '(';
    for (size_t i = 0; i < p.constraints.size(); ++i) {
        if (i) oss << ", ";
        const auto& c = p.constraints[i];
        oss << c.attribute.name << ' ' << toString(c.op) << ' ' << toString(c.term);
    }
    oss << ')';
    return oss.str();
}

std::string toString(const Condition& c) {
    if (const auto* p = std::get_if<Pattern>(&c)) return toString(*p);
    if (const auto* n = std::get_if<NegatedPattern>(&c)) return "not " + toString(n->pattern);
    return "test(" + toString(*std::get<TestCondition>(c).expr) + ")";
}

std::string toString(const Action& a) {
    if (const auto* r = std::get_if<RetractAction>(&a)) return "retract ?" + r->factVar.name;
    const auto& as = std::get<AssertAction>(a);
    std::ostringstream oss;
    oss << "assert " << as.kind.name << '(';
    for (size_t i = 0; i < as.attributes.size(); ++i) {
        if (i) oss << ", ";
        oss << as.attributes[i].name.name << " = " << toString(*as.attributes[i].value);
    }
    oss << ')';
    return oss.str();
}

std::string toString(const Statement& st) {
    struct V2 {
        std::string operator()(const RuleDecl& r) const {
            std::ostringstream oss;
            oss << "rule " << r.name.name;
            if (r.priority != 0) oss << " priority " << r.priority;
            oss << " { ";
            for (const auto& c : r.conditions) oss << toString(c) << ' ';
            oss << "=>";
            for (const auto& a : r.actions) oss << ' ' << toString(a);
            oss << " }";
            return oss.str();
        }
        std::string operator()(const FactDecl& f) const {
            return "fact " + toString(f.kind.name, toAttributes(f));
        }
        std::string operator()(const OutputDecl& o) const {
            std::ostringstream oss;
            oss << "output ";
            for (size_t i = 0; i < o.kinds.size(); ++i) {
                if (i) oss << ", ";
                oss << o.kinds[i].name;
            }
            return oss.str();
        }
    } v;
    return std::visit(v, st);
}

Attributes toAttributes(const FactDecl& decl) {
    Attributes attrs;
    for (const auto& a : decl.attributes) {
        attrs[a.name.name] = a.value;
    }
    return attrs;
}

} // namespace ag
