#include "AG/Parser.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include "AG/Lexer.hpp"

namespace ag {

namespace {

using ag::lex::Token;
using ag::lex::TokenStream;

class Parser {
public:
    explicit Parser(const std::string_view src) : toks_(src) {
        advance();
    }

    Program parseProgram() {
        Program prog;
        while (tok_.type != Token::End) {
            if (accept(Token::Semicolon)) continue;
            prog.statements.push_back(parseStatement());
        }
        return prog;
    }

private:
    TokenStream toks_;
    Token tok_;

    void advance() { tok_ = toks_.consume(); }

    bool isKeyword(const char* kw) const {
        return tok_.type == Token::Identifier && tok_.text == kw;
    }

    [[noreturn]] void errorHere(const std::string& msg) const {
        std::ostringstream oss;
        oss << "Parse error at line " << tok_.loc.line << ", col " << tok_.loc.column << ": " << msg;
        if (tok_.type == Token::End) oss << " (found end of input)";
        else oss << " (found '" << tok_.text << "')";
        throw ParseError(oss.str());
    }

    bool accept(Token::Type t) {
        if (tok_.type == t) { advance(); return true; }
        return false;
    }

    void expect(Token::Type t, const char* what) {
        if (!accept(t)) {
            errorHere(std::string("expected ") + what);
        }
    }

    void expectKeyword(const char* kw) {
        if (!isKeyword(kw)) errorHere(std::string("expected '") + kw + "'");
        advance();
    }

    Identifier parseIdentifier() {
        if (tok_.type != Token::Identifier) errorHere("identifier expected");
        Identifier id{tok_.text, tok_.loc};
        advance();
        return id;
    }

    Variable parseVariable() {
        if (tok_.type != Token::Variable) errorHere("variable expected");
        Variable v{tok_.text, tok_.loc};
        advance();
        return v;
    }

    int parseSignedInteger() {
        bool negative = accept(Token::Minus);
        if (tok_.type != Token::Integer) errorHere("integer expected");
        int v = 0;
        try {
            v = std::stoi(tok_.text);
        } catch (const std::out_of_range&) {
            errorHere("integer out of range");
        }
        advance();
        return negative ? -v : v;
    }

    double parseNumber() {
        double d = 0;
        try {
            d = std::stod(tok_.text);
        } catch (const std::out_of_range&) {
            errorHere("number out of range");
        }
        advance();
        return d;
    }

    // literal := ['-'] number | string | true | false | bare identifier
    Value parseLiteral() {
        if (tok_.type == Token::Minus) {
            advance();
            if (tok_.type != Token::Integer && tok_.type != Token::Float) errorHere("number expected after '-'");
            double d = parseNumber();
            return Value(-d);
        }
        if (tok_.type == Token::Integer || tok_.type == Token::Float) {
            return Value(parseNumber());
        }
        if (tok_.type == Token::String) {
            Value v(tok_.text);
            advance();
            return v;
        }
        if (tok_.type == Token::Identifier) {
            Value v = tok_.text == "true" ? Value(true)
                    : tok_.text == "false" ? Value(false)
                    : Value(tok_.text);
            advance();
            return v;
        }
        errorHere("literal expected");
    }

    Statement parseStatement() {
        if (isKeyword("rule")) return parseRule();
        if (isKeyword("fact")) {
            advance();
            return parseFactDecl();
        }
        if (isKeyword("output")) return parseOutput();
        errorHere("expected 'rule', 'fact' or 'output'");
    }

    // rule NAME [priority N] { condition* => action* }
    RuleDecl parseRule() {
        RuleDecl r; r.loc = tok_.loc;
        expectKeyword("rule");
        r.name = parseIdentifier();
        if (isKeyword("priority") || isKeyword("salience")) {
            advance();
            r.priority = parseSignedInteger();
        }
        expect(Token::LBrace, "'{'");
        while (tok_.type != Token::FatArrow) {
            if (tok_.type == Token::End || tok_.type == Token::RBrace) errorHere("expected '=>' in rule " + r.name.name);
            r.conditions.push_back(parseCondition());
            accept(Token::Comma);
        }
        expect(Token::FatArrow, "'=>'");
        while (!accept(Token::RBrace)) {
            if (tok_.type == Token::End) errorHere("expected '}' to close rule " + r.name.name);
            r.actions.push_back(parseAction());
            accept(Token::Semicolon);
        }
        return r;
    }

    Condition parseCondition() {
        if (tok_.type == Token::Variable) {
            Variable fv = parseVariable();
            expect(Token::LArrow, "'<-' after fact variable");
            Pattern p = parsePattern();
            p.factVar = fv;
            p.loc = fv.loc;
            return p;
        }
        if (isKeyword("not") && toks_.peek().type == Token::Identifier) {
            NegatedPattern n; n.loc = tok_.loc;
            advance();
            n.pattern = parsePattern();
            return n;
        }
        if (isKeyword("test") && toks_.peek().type == Token::LParen) {
            TestCondition t; t.loc = tok_.loc;
            advance();
            expect(Token::LParen, "'('");
            t.expr = parseExpr();
            expect(Token::RParen, "')'");
            return t;
        }
        return parsePattern();
    }

    // kind(attr OP term, ...)
    Pattern parsePattern() {
        Pattern p; p.loc = tok_.loc;
        p.kind = parseIdentifier();
        expect(Token::LParen, "'(' after fact kind");
        if (!accept(Token::RParen)) {
            p.constraints.push_back(parseConstraint());
            while (accept(Token::Comma)) {
                p.constraints.push_back(parseConstraint());
            }
            expect(Token::RParen, "')'");
        }
        return p;
    }

    Constraint parseConstraint() {
        Constraint c; c.loc = tok_.loc;
        c.attribute = parseIdentifier();
        switch (tok_.type) {
            case Token::Equals:
            case Token::EqEq: c.op = CompareOp::Eq; break;
            case Token::NotEq: c.op = CompareOp::Ne; break;
            case Token::Less: c.op = CompareOp::Lt; break;
            case Token::Le: c.op = CompareOp::Le; break;
            case Token::Greater: c.op = CompareOp::Gt; break;
            case Token::Ge: c.op = CompareOp::Ge; break;
            default: errorHere("comparison operator expected after attribute '" + c.attribute.name + "'");
        }
        advance();
        if (tok_.type == Token::Variable) c.term = parseVariable();
        else c.term = parseLiteral();
        return c;
    }

    Action parseAction() {
        if (isKeyword("assert")) {
            AssertAction a; a.loc = tok_.loc;
            advance();
            a.kind = parseIdentifier();
            expect(Token::LParen, "'(' after fact kind");
            if (!accept(Token::RParen)) {
                do {
                    AttributeAssign attr;
                    attr.name = parseIdentifier();
                    expect(Token::Equals, "'='");
                    attr.value = parseExpr();
                    a.attributes.push_back(std::move(attr));
                } while (accept(Token::Comma));
                expect(Token::RParen, "')'");
            }
            return a;
        }
        if (isKeyword("retract")) {
            RetractAction r; r.loc = tok_.loc;
            advance();
            r.factVar = parseVariable();
            return r;
        }
        errorHere("expected 'assert' or 'retract'");
    }

    FactDecl parseFactDecl() {
        FactDecl f; f.loc = tok_.loc;
        f.kind = parseIdentifier();
        expect(Token::LParen, "'(' after fact kind");
        if (!accept(Token::RParen)) {
            do {
                FactAttribute attr;
                attr.name = parseIdentifier();
                expect(Token::Equals, "'='");
                attr.value = parseLiteral();
                f.attributes.push_back(std::move(attr));
            } while (accept(Token::Comma));
            expect(Token::RParen, "')'");
        }
        return f;
    }

    OutputDecl parseOutput() {
        OutputDecl o; o.loc = tok_.loc;
        expectKeyword("output");
        o.kinds.push_back(parseIdentifier());
        while (accept(Token::Comma)) {
            o.kinds.push_back(parseIdentifier());
        }
        return o;
    }

    // Hierarchy: parseExpr -> parseOr -> parseAnd -> parseNot -> parseComparison
    //            -> parseAddSub -> parseTerm -> parseUnary -> parsePrimary
    ExprPtr parseExpr() {
        return parseOr();
    }

    ExprPtr makeBinary(ExprBinary::Op op, ExprPtr lhs, ExprPtr rhs) {
        auto e = std::make_shared<Expr>();
        e->loc = lhs->loc;
        ExprBinary bin; bin.op = op; bin.lhs = std::move(lhs); bin.rhs = std::move(rhs);
        e->node = std::move(bin);
        return e;
    }

    ExprPtr parseOr() {
        auto lhs = parseAnd();
        while (isKeyword("or")) {
            advance();
            lhs = makeBinary(ExprBinary::Op::Or, lhs, parseAnd());
        }
        return lhs;
    }

    ExprPtr parseAnd() {
        auto lhs = parseNot();
        while (isKeyword("and")) {
            advance();
            lhs = makeBinary(ExprBinary::Op::And, lhs, parseNot());
        }
        return lhs;
    }

    ExprPtr parseNot() {
        if (isKeyword("not")) {
            SourceLocation loc = tok_.loc;
            advance();
            auto e = std::make_shared<Expr>(); e->loc = loc;
            e->node = ExprUnary{ExprUnary::Op::Not, parseNot()};
            return e;
        }
        return parseComparison();
    }

    // parseComparison: handles comparison operators (<, >, <=, >=, ==, !=)
    // These have lower precedence than arithmetic operators
    ExprPtr parseComparison() {
        auto lhs = parseAddSub();
        if (tok_.type == Token::Less || tok_.type == Token::Le ||
            tok_.type == Token::Greater || tok_.type == Token::Ge ||
            tok_.type == Token::EqEq || tok_.type == Token::NotEq) {
            Token::Type opType = tok_.type;
            advance();
            auto rhs = parseAddSub();
            ExprBinary::Op op = ExprBinary::Op::Eq;
            switch (opType) {
                case Token::Less: op = ExprBinary::Op::Lt; break;
                case Token::Le: op = ExprBinary::Op::Le; break;
                case Token::Greater: op = ExprBinary::Op::Gt; break;
                case Token::Ge: op = ExprBinary::Op::Ge; break;
                case Token::EqEq: op = ExprBinary::Op::Eq; break;
                case Token::NotEq: op = ExprBinary::Op::Ne; break;
                default: errorHere("internal error: unexpected comparison operator");
            }
            return makeBinary(op, lhs, rhs);
        }
        return lhs;
    }

    // parseAddSub: handles addition and subtraction (higher precedence than comparisons)
    ExprPtr parseAddSub() {
        auto lhs = parseTerm();
        while (tok_.type == Token::Plus || tok_.type == Token::Minus) {
            Token::Type op = tok_.type; advance();
            auto rhs = parseTerm();
            lhs = makeBinary(op == Token::Plus ? ExprBinary::Op::Add : ExprBinary::Op::Sub, lhs, rhs);
        }
        return lhs;
    }

    // term := unary { ('*' | '/') unary }
    ExprPtr parseTerm() {
        auto lhs = parseUnary();
        while (tok_.type == Token::Star || tok_.type == Token::Slash) {
            Token::Type op = tok_.type; advance();
            auto rhs = parseUnary();
            lhs = makeBinary(op == Token::Star ? ExprBinary::Op::Mul : ExprBinary::Op::Div, lhs, rhs);
        }
        return lhs;
    }

    ExprPtr parseUnary() {
        if (tok_.type == Token::Minus) {
            SourceLocation loc = tok_.loc;
            advance();
            auto e = std::make_shared<Expr>(); e->loc = loc;
            e->node = ExprUnary{ExprUnary::Op::Neg, parseUnary()};
            return e;
        }
        return parsePrimary();
    }

    // primary := number | string | true | false | ?var | call | symbol | '(' expr ')'
    ExprPtr parsePrimary() {
        auto e = std::make_shared<Expr>();
        e->loc = tok_.loc;
        if (accept(Token::LParen)) {
            auto inner = parseExpr();
            expect(Token::RParen, "')'");
            e->node = ExprParen{inner};
            return e;
        }
        if (tok_.type == Token::Variable) {
            e->node = ExprVariable{parseVariable()};
            return e;
        }
        if (tok_.type == Token::Identifier && toks_.peek().type == Token::LParen) {
            ExprCall call;
            call.func = parseIdentifier();
            expect(Token::LParen, "'('");
            if (!accept(Token::RParen)) {
                call.args.push_back(parseExpr());
                while (accept(Token::Comma)) {
                    call.args.push_back(parseExpr());
                }
                expect(Token::RParen, "')'");
            }
            e->node = std::move(call);
            return e;
        }
        if (tok_.type == Token::Integer || tok_.type == Token::Float ||
            tok_.type == Token::String || tok_.type == Token::Identifier) {
            e->node = ExprLiteral{parseLiteral()};
            return e;
        }
        errorHere("expression expected");
    }
};

} // namespace

Program parseProgram(const std::string_view source) {
    Parser p(source);
    return p.parseProgram();
}

Program parseFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw ParseError("Cannot open file: " + path);
    std::stringstream buffer; buffer << ifs.rdbuf();
    return parseProgram(buffer.str());
}

} // namespace ag
