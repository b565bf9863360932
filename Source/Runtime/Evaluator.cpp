#include "AG/Runtime/Evaluator.hpp"

namespace ag {
    namespace eval {
        namespace {
            std::optional<Value> evalBinary(const ExprBinary& bin,
                                            const Binding& binding,
                                            const FunctionRegistry& functions) {
                // Logical operators short-circuit and require booleans
                if (bin.op == ExprBinary::Op::And || bin.op == ExprBinary::Op::Or) {
                    auto lhs = evaluate(*bin.lhs, binding, functions);
                    if (!lhs || !lhs->isBool()) return std::nullopt;
                    if (bin.op == ExprBinary::Op::And && !lhs->asBool()) return Value(false);
                    if (bin.op == ExprBinary::Op::Or && lhs->asBool()) return Value(true);
                    auto rhs = evaluate(*bin.rhs, binding, functions);
                    if (!rhs || !rhs->isBool()) return std::nullopt;
                    return Value(rhs->asBool());
                }

                auto lhs = evaluate(*bin.lhs, binding, functions);
                if (!lhs) return std::nullopt;
                auto rhs = evaluate(*bin.rhs, binding, functions);
                if (!rhs) return std::nullopt;

                switch (bin.op) {
                    case ExprBinary::Op::Lt: return Value(compareValues(CompareOp::Lt, *lhs, *rhs));
                    case ExprBinary::Op::Le: return Value(compareValues(CompareOp::Le, *lhs, *rhs));
                    case ExprBinary::Op::Gt: return Value(compareValues(CompareOp::Gt, *lhs, *rhs));
                    case ExprBinary::Op::Ge: return Value(compareValues(CompareOp::Ge, *lhs, *rhs));
                    case ExprBinary::Op::Eq: return Value(compareValues(CompareOp::Eq, *lhs, *rhs));
                    case ExprBinary::Op::Ne: return Value(compareValues(CompareOp::Ne, *lhs, *rhs));
                    default: break;
                }

                if (bin.op == ExprBinary::Op::Add && lhs->isString() && rhs->isString()) {
                    return Value(lhs->asString() + rhs->asString());
                }
                if (!lhs->isNumber() || !rhs->isNumber()) return std::nullopt;
                const double l = lhs->asNumber();
                const double r = rhs->asNumber();
                switch (bin.op) {
                    case ExprBinary::Op::Add: return Value(l + r);
                    case ExprBinary::Op::Sub: return Value(l - r);
                    case ExprBinary::Op::Mul: return Value(l * r);
                    case ExprBinary::Op::Div:
                        if (r == 0.0) return std::nullopt;
                        return Value(l / r);
                    default: return std::nullopt;
                }
            }
        } // namespace

        std::optional<Value> evaluate(const Expr& expr,
                                      const Binding& binding,
                                      const FunctionRegistry& functions) {
            if (const auto* lit = std::get_if<ExprLiteral>(&expr.node)) {
                return lit->value;
            }
            if (const auto* var = std::get_if<ExprVariable>(&expr.node)) {
                auto it = binding.values.find(var->var.name);
                if (it == binding.values.end()) return std::nullopt; // unbound
                return it->second;
            }
            if (const auto* paren = std::get_if<ExprParen>(&expr.node)) {
                if (!paren->inner) return std::nullopt;
                return evaluate(*paren->inner, binding, functions);
            }
            if (const auto* call = std::get_if<ExprCall>(&expr.node)) {
                const Function* fn = functions.find(call->func.name);
                if (!fn) return std::nullopt;
                if (call->args.size() < fn->minArgs || call->args.size() > fn->maxArgs) return std::nullopt;
                std::vector<Value> args;
                args.reserve(call->args.size());
                for (const auto& a : call->args) {
                    auto v = evaluate(*a, binding, functions);
                    if (!v) return std::nullopt;
                    args.push_back(std::move(*v));
                }
                return fn->impl(args);
            }
            if (const auto* bin = std::get_if<ExprBinary>(&expr.node)) {
                return evalBinary(*bin, binding, functions);
            }
            if (const auto* un = std::get_if<ExprUnary>(&expr.node)) {
                auto v = evaluate(*un->operand, binding, functions);
                if (!v) return std::nullopt;
                if (un->op == ExprUnary::Op::Neg) {
                    if (!v->isNumber()) return std::nullopt;
                    return Value(-v->asNumber());
                }
                if (!v->isBool()) return std::nullopt;
                return Value(!v->asBool());
            }
            return std::nullopt;
        }

        bool evaluateTest(const Expr& expr,
                          const Binding& binding,
                          const FunctionRegistry& functions) {
            auto v = evaluate(expr, binding, functions);
            return v && v->isBool() && v->asBool();
        }

        void collectVariables(const Expr& expr, std::vector<Variable>& out) {
            if (const auto* var = std::get_if<ExprVariable>(&expr.node)) {
                out.push_back(var->var);
            } else if (const auto* paren = std::get_if<ExprParen>(&expr.node)) {
                if (paren->inner) collectVariables(*paren->inner, out);
            } else if (const auto* call = std::get_if<ExprCall>(&expr.node)) {
                for (const auto& a : call->args) collectVariables(*a, out);
            } else if (const auto* bin = std::get_if<ExprBinary>(&expr.node)) {
                collectVariables(*bin->lhs, out);
                collectVariables(*bin->rhs, out);
            } else if (const auto* un = std::get_if<ExprUnary>(&expr.node)) {
                collectVariables(*un->operand, out);
            }
        }

        void collectCalls(const Expr& expr, std::vector<const ExprCall*>& out) {
            if (const auto* paren = std::get_if<ExprParen>(&expr.node)) {
                if (paren->inner) collectCalls(*paren->inner, out);
            } else if (const auto* call = std::get_if<ExprCall>(&expr.node)) {
                out.push_back(call);
                for (const auto& a : call->args) collectCalls(*a, out);
            } else if (const auto* bin = std::get_if<ExprBinary>(&expr.node)) {
                collectCalls(*bin->lhs, out);
                collectCalls(*bin->rhs, out);
            } else if (const auto* un = std::get_if<ExprUnary>(&expr.node)) {
                collectCalls(*un->operand, out);
            }
        }
    } // namespace eval
} // namespace ag
