#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "AG/AST.hpp"

namespace ag::lex {

    struct Token {
        enum Type {
            Identifier, Integer, Float, String,
            Variable,            // '?name' pattern variable
            LParen, RParen, LBrace, RBrace,
            Comma, Equals, Semicolon,
            Plus, Minus, Star, Slash,
            Greater, Less, Ge, Le, EqEq, NotEq,
            LArrow,              // '<-' binds a fact address
            FatArrow,            // '=>' separates conditions from actions
            End, Unknown
        } type{End};
        std::string text;
        SourceLocation loc{};
    };

    class TokenStream {
    public:
        explicit TokenStream(std::string_view src);
        [[nodiscard]] const Token& peek() const;
        [[nodiscard]] const Token& lookahead(size_t n) const; // look ahead without consuming
        Token consume();
    private:
        std::vector<Token> tokens_;
        size_t idx_{0};
    };

}
