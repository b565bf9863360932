#include "AG/Lexer.hpp"
#include <tao/pegtl.hpp>

namespace ag::lex {

    namespace pegtl = tao::pegtl;

    static SourceLocation locFrom(const pegtl::position& p) {
        SourceLocation l; l.line = p.line; l.column = p.column; return l;
    }

    // Whitespace and comments (skipped). Newlines carry no meaning in
    // knowledge-base files.
    struct sp : pegtl::sor< pegtl::one<' '>, pegtl::one<'\t'>, pegtl::one<'\r'>, pegtl::one<'\n'> > {};
    struct line_comment : pegtl::seq< pegtl::two<'/'>, pegtl::until< pegtl::at< pegtl::eolf >, pegtl::any > > {};
    struct hash_comment : pegtl::seq< pegtl::one<'#'>, pegtl::until< pegtl::at< pegtl::eolf >, pegtl::any > > {};
    struct block_comment : pegtl::seq< pegtl::string<'/','*'>, pegtl::until< pegtl::string<'*','/'>, pegtl::any > > {};
    struct skipped : pegtl::sor< sp, line_comment, hash_comment, block_comment > {};

    // Identifiers (hyphens allowed after the first character, e.g. leaf-yellowing)
    struct ident_start : pegtl::sor< pegtl::alpha, pegtl::one<'_'> > {};
    struct ident_rest  : pegtl::sor< pegtl::alnum, pegtl::one<'_'>,
                                     pegtl::seq< pegtl::one<'-'>, pegtl::at< pegtl::sor< pegtl::alpha, pegtl::one<'_'> > > > > {};
    struct identifier  : pegtl::seq< ident_start, pegtl::star< ident_rest > > {};

    // Pattern variables: ?name. The name rule is distinct from `identifier`
    // so that no identifier token is emitted for it.
    struct var_name : pegtl::seq< ident_start, pegtl::star< ident_rest > > {};
    struct variable : pegtl::seq< pegtl::one<'?'>, var_name > {};

    // Numbers (unsigned; the parser handles unary minus)
    struct digits : pegtl::plus< pegtl::digit > {};
    struct frac : pegtl::seq< pegtl::one<'.'>, pegtl::star< pegtl::digit > > {};
    struct expn : pegtl::seq< pegtl::sor< pegtl::one<'e'>, pegtl::one<'E'> >, pegtl::opt< pegtl::one<'+','-'> >, digits > {};
    struct number : pegtl::seq< pegtl::sor< pegtl::seq< digits, pegtl::opt< frac > >, pegtl::seq< pegtl::one<'.'>, digits > >, pegtl::opt< expn > > {};

    // Strings: simple handling with escapes
    struct esc_seq : pegtl::seq< pegtl::one<'\\'>, pegtl::any > {};
    struct dquot_str_content : pegtl::until< pegtl::one<'"'>, pegtl::sor< esc_seq, pegtl::not_one<'"'> > > {};
    struct squot_str_content : pegtl::until< pegtl::one<'\''>, pegtl::sor< esc_seq, pegtl::not_one<'\''> > > {};
    struct dquoted_string : pegtl::seq< pegtl::one<'"'>, dquot_str_content > {};
    struct squoted_string : pegtl::seq< pegtl::one<'\''>, squot_str_content > {};
    struct string_lit : pegtl::sor< dquoted_string, squoted_string > {};

    // Single and multi-char tokens
    struct lparen : pegtl::one<'('> {};
    struct rparen : pegtl::one<')'> {};
    struct lbrace : pegtl::one<'{'> {};
    struct rbrace : pegtl::one<'}'> {};
    struct comma  : pegtl::one<','> {};
    struct equals : pegtl::one<'='> {};
    struct semi   : pegtl::one<';'> {};
    struct plus   : pegtl::one<'+'> {};
    struct minus  : pegtl::one<'-'> {};
    struct star   : pegtl::one<'*'> {};
    struct slash  : pegtl::one<'/'> {};
    struct larrow : pegtl::string<'<','-'> {};
    struct fatarrow : pegtl::string<'=','>'> {};

    // Comparison operators
    struct ge : pegtl::string<'>','='> {}; // >=
    struct le : pegtl::string<'<','='> {}; // <=
    struct eqeq : pegtl::string<'=','='> {}; // ==
    struct noteq : pegtl::string<'!','='> {}; // !=
    struct gt : pegtl::one<'>'> {};
    struct lt : pegtl::one<'<' > {};

    // Unknown single char fallback, NUL included, so that tokenizing always
    // reaches the end of input and the parser reports stray bytes
    struct unknown_char : pegtl::any {};

    // Token union in priority order
    struct token_rule : pegtl::sor<
                skipped,
                string_lit,
                number,
                variable,
                identifier,
                fatarrow, larrow, ge, le, eqeq, noteq, gt, lt,
                lparen, rparen, lbrace, rbrace, comma, equals, semi, plus, minus, star, slash,
                unknown_char
            > {};

    struct tokens_grammar : pegtl::must< pegtl::star< token_rule >, pegtl::eof > {};

    // Actions
    template< typename Rule > struct action : pegtl::nothing< Rule > {};

    struct TokenSink {
        std::vector<Token> out;
    };

    static std::string unescape(const std::string& s) {
        if (s.empty()) return {};
        char quote = s.front();
        size_t i = 1;
        std::string res;
        while (i < s.size()) {
            char c = s[i++];
            if (c == quote) break;
            if (c == '\\' && i < s.size()) {
                switch (const char e = s[i++]) {
                    case 'n': res.push_back('\n'); break;
                    case 't': res.push_back('\t'); break;
                    case 'r': res.push_back('\r'); break;
                    case '\\': res.push_back('\\'); break;
                    case '"': res.push_back('"'); break;
                    case '\'': res.push_back('\''); break;
                    default: res.push_back(e); break;
                }
            } else {
                res.push_back(c);
            }
        }
        return res;
    }

    // identifier
    template<> struct action< identifier > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::Identifier; t.text = in.string(); t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

    // variable: strip the leading '?'
    template<> struct action< variable > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::Variable; t.text = in.string().substr(1); t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

    // number
    template<> struct action< number > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.text = in.string(); t.loc = locFrom(in.position());
            if (t.text.find_first_of(".eE") != std::string::npos) t.type = Token::Float; else t.type = Token::Integer;
            sink.out.push_back(std::move(t));
        }
    };

    // string
    template<> struct action< string_lit > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::String; t.text = unescape(in.string()); t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

#define DEFINE_TOKEN_ACTION(rule, tokentype) \
    template<> struct action< rule > { \
        template< typename Input > \
        static void apply(const Input& in, TokenSink& sink) { \
            Token t; t.type = tokentype; t.text = in.string(); t.loc = locFrom(in.position()); \
            sink.out.push_back(std::move(t)); \
        } \
    };

    DEFINE_TOKEN_ACTION(lparen, Token::LParen)
    DEFINE_TOKEN_ACTION(rparen, Token::RParen)
    DEFINE_TOKEN_ACTION(lbrace, Token::LBrace)
    DEFINE_TOKEN_ACTION(rbrace, Token::RBrace)
    DEFINE_TOKEN_ACTION(comma,  Token::Comma)
    DEFINE_TOKEN_ACTION(equals, Token::Equals)
    DEFINE_TOKEN_ACTION(semi,   Token::Semicolon)
    DEFINE_TOKEN_ACTION(plus,   Token::Plus)
    DEFINE_TOKEN_ACTION(minus,  Token::Minus)
    DEFINE_TOKEN_ACTION(star,   Token::Star)
    DEFINE_TOKEN_ACTION(slash,  Token::Slash)
    DEFINE_TOKEN_ACTION(larrow, Token::LArrow)
    DEFINE_TOKEN_ACTION(fatarrow, Token::FatArrow)
    DEFINE_TOKEN_ACTION(ge, Token::Ge)
    DEFINE_TOKEN_ACTION(le, Token::Le)
    DEFINE_TOKEN_ACTION(eqeq, Token::EqEq)
    DEFINE_TOKEN_ACTION(noteq, Token::NotEq)
    DEFINE_TOKEN_ACTION(gt, Token::Greater)
    DEFINE_TOKEN_ACTION(lt, Token::Less)
    DEFINE_TOKEN_ACTION(unknown_char, Token::Unknown)

#undef DEFINE_TOKEN_ACTION

    TokenStream::TokenStream(std::string_view src) {
        pegtl::memory_input in(src, "<input>");
        TokenSink sink;
        pegtl::parse< tokens_grammar, action >(in, sink);
        Token end; end.type = Token::End; end.text = ""; end.loc = {0,0};
        if (!sink.out.empty()) {
            end.loc = sink.out.back().loc;
        }
        sink.out.push_back(std::move(end));
        tokens_ = std::move(sink.out);
    }

    const Token& TokenStream::peek() const { return tokens_[idx_]; }
    const Token& TokenStream::lookahead(size_t n) const {
        return idx_ + n < tokens_.size() ? tokens_[idx_ + n] : tokens_.back();
    }
    Token TokenStream::consume() {
        if (idx_ + 1 >= tokens_.size()) return tokens_.back();
        return tokens_[idx_++];
    }

}
