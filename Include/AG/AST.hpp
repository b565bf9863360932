#pragma once

#include "AG/core.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ag {

struct SourceLocation {
    size_t line{1};
    size_t column{1};
};

struct Identifier {
    std::string name;
    SourceLocation loc{};
};

// Pattern variable, written ?name in rule text. `name` excludes the '?'.
struct Variable {
    std::string name;
    SourceLocation loc{};
};

// Expression model for test guards and computed action attributes
struct Expr;
using ExprPtr = std::shared_ptr<Expr>;

struct ExprLiteral { Value value; };
struct ExprVariable { Variable var; };
struct ExprParen { ExprPtr inner; };
struct ExprCall { Identifier func; std::vector<ExprPtr> args; };
struct ExprBinary {
    enum class Op {
        Add, Sub, Mul, Div,       // Arithmetic operators
        Lt, Le, Gt, Ge, Eq, Ne,   // Comparison operators: <, <=, >, >=, ==, !=
        And, Or                   // Logical operators
    };
    Op op{Op::Add};
    ExprPtr lhs;
    ExprPtr rhs;
};

struct ExprUnary {
    enum class Op { Neg, Not };  // Unary minus and logical not
    Op op;
    ExprPtr operand;
};

struct Expr {
    SourceLocation loc{};
    std::variant<ExprLiteral, ExprVariable, ExprParen, ExprCall, ExprBinary, ExprUnary> node;
};

// Right-hand side of a pattern constraint: a literal or a variable
using Term = std::variant<Value, Variable>;

// attribute OP term, e.g. ph < 6.0 or crop = ?c
struct Constraint {
    Identifier attribute;
    CompareOp op{CompareOp::Eq};
    Term term;
    SourceLocation loc{};
};

// kind(constraint, ...), optionally captured as ?f <- kind(...)
struct Pattern {
    Identifier kind;
    std::vector<Constraint> constraints;
    std::optional<Variable> factVar;
    SourceLocation loc{};
};

// not kind(...): holds when no live fact matches
struct NegatedPattern {
    Pattern pattern;
    SourceLocation loc{};
};

// test(expr): holds when expr evaluates to true
struct TestCondition {
    ExprPtr expr;
    SourceLocation loc{};
};

using Condition = std::variant<Pattern, NegatedPattern, TestCondition>;

struct AttributeAssign {
    Identifier name;
    ExprPtr value;
};

struct AssertAction {
    Identifier kind;
    std::vector<AttributeAssign> attributes;
    SourceLocation loc{};
};

struct RetractAction {
    Variable factVar;
    SourceLocation loc{};
};

using Action = std::variant<AssertAction, RetractAction>;

// Statements
struct RuleDecl {
    Identifier name;
    int priority{0};
    std::vector<Condition> conditions;
    std::vector<Action> actions;
    SourceLocation loc{};
};

struct FactAttribute {
    Identifier name;
    Value value;
};

// fact kind(attr = literal, ...): asserted into every new session, or read
// as an observation by the command line tool
struct FactDecl {
    Identifier kind;
    std::vector<FactAttribute> attributes;
    SourceLocation loc{};
};

// output diagnosis, recommendation
struct OutputDecl {
    std::vector<Identifier> kinds;
    SourceLocation loc{};
};

using Statement = std::variant<RuleDecl, FactDecl, OutputDecl>;

struct Program {
    std::vector<Statement> statements;
};

// Simple printable summary helpers (debug)
std::string toString(const Expr& e);
std::string toString(const Term& t);
std::string toString(const Pattern& p);
std::string toString(const Condition& c);
std::string toString(const Action& a);
std::string toString(const Statement& st);

// Convert a parsed fact declaration into its attribute map
Attributes toAttributes(const FactDecl& decl);

} // namespace ag
