#include "pch.h"
#include "nb_scanner.hpp"
#include "nb_errors.hpp"
#include <charconv>

namespace nbimport {

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

class Scanner {
public:
    Scanner(std::string_view src, const std::string& origin)
        : src_(src), origin_(origin) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        for (;;) {
            skip_trivia();
            Token tok;
            tok.pos = here_;
            if (at_end()) {
                out.push_back(std::move(tok));
                return out;
            }
            scan_one(tok);
            out.push_back(std::move(tok));
        }
    }

private:
    std::string_view src_;
    const std::string& origin_;
    size_t at_{0};
    SourcePos here_;

    bool at_end() const { return at_ >= src_.size(); }
    char cur() const { return at_end() ? '\0' : src_[at_]; }
    char ahead(size_t n = 1) const { return at_ + n < src_.size() ? src_[at_ + n] : '\0'; }

    char bump() {
        char c = src_[at_++];
        if (c == '\n') {
            ++here_.line;
            here_.column = 1;
        } else {
            ++here_.column;
        }
        return c;
    }

    bool eat(char c) {
        if (cur() != c) return false;
        bump();
        return true;
    }

    [[noreturn]] void fail(SourcePos pos, const std::string& message) const {
        throw ParseError(origin_, message, pos.line, pos.column);
    }

    void skip_trivia() {
        while (!at_end()) {
            const char c = cur();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                bump();
            } else if (c == '#' || (c == '/' && ahead() == '/')) {
                while (!at_end() && cur() != '\n') bump();
            } else if (c == '/' && ahead() == '*') {
                const SourcePos start = here_;
                bump();
                bump();
                while (!(cur() == '*' && ahead() == '/')) {
                    if (at_end()) fail(start, "unterminated comment");
                    bump();
                }
                bump();
                bump();
            } else {
                return;
            }
        }
    }

    void scan_one(Token& tok) {
        const char c = cur();
        if (is_digit(c)) return scan_number(tok);
        if (is_name_start(c)) return scan_name(tok);
        if (c == '"') return scan_text(tok);

        bump();
        tok.text.assign(1, c);
        switch (c) {
            case '(': tok.kind = Tok::LParen; return;
            case ')': tok.kind = Tok::RParen; return;
            case '{': tok.kind = Tok::LBrace; return;
            case '}': tok.kind = Tok::RBrace; return;
            case ',': tok.kind = Tok::Comma; return;
            case '.': tok.kind = Tok::Dot; return;
            case ';': tok.kind = Tok::Semi; return;
            case '+': tok.kind = with_equals(tok, Tok::Plus, Tok::PlusAssign); return;
            case '-': tok.kind = with_equals(tok, Tok::Minus, Tok::MinusAssign); return;
            case '*': tok.kind = with_equals(tok, Tok::Star, Tok::StarAssign); return;
            case '/': tok.kind = with_equals(tok, Tok::Slash, Tok::SlashAssign); return;
            case '%': tok.kind = with_equals(tok, Tok::Percent, Tok::PercentAssign); return;
            case '=': tok.kind = with_equals(tok, Tok::Assign, Tok::Eq); return;
            case '!': tok.kind = with_equals(tok, Tok::Bang, Tok::Ne); return;
            case '<': tok.kind = with_equals(tok, Tok::Lt, Tok::Le); return;
            case '>': tok.kind = with_equals(tok, Tok::Gt, Tok::Ge); return;
            case '&':
                if (!eat('&')) fail(tok.pos, "expected '&&'");
                tok.kind = Tok::AndAnd;
                tok.text = "&&";
                return;
            case '|':
                if (!eat('|')) fail(tok.pos, "expected '||'");
                tok.kind = Tok::OrOr;
                tok.text = "||";
                return;
            default:
                fail(tok.pos, "unexpected character '" + tok.text + "'");
        }
    }

    Tok with_equals(Token& tok, Tok plain, Tok paired) {
        if (!eat('=')) return plain;
        tok.text += '=';
        return paired;
    }

    void scan_name(Token& tok) {
        const size_t start = at_;
        while (is_name_char(cur())) bump();
        tok.text.assign(src_.substr(start, at_ - start));
        tok.kind = keyword_or_name(tok.text);
    }

    void scan_number(Token& tok) {
        const size_t start = at_;
        while (is_digit(cur())) bump();
        bool real = false;
        if (cur() == '.' && is_digit(ahead())) {
            real = true;
            bump();
            while (is_digit(cur())) bump();
        }
        tok.text.assign(src_.substr(start, at_ - start));

        if (real) {
            tok.kind = Tok::Real;
            tok.number = std::strtod(tok.text.c_str(), nullptr);
            return;
        }

        int64_t value = 0;
        const char* first = tok.text.data();
        const char* last = first + tok.text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            fail(tok.pos, "integer literal " + tok.text + " is out of range");
        }
        tok.kind = Tok::Int;
        tok.number = value;
    }

    void scan_text(Token& tok) {
        bump();  // opening quote
        tok.kind = Tok::Text;
        for (;;) {
            if (at_end()) fail(tok.pos, "unterminated string");
            const char c = bump();
            if (c == '"') return;
            if (c != '\\' || at_end()) {
                tok.text += c;
                continue;
            }
            const char esc = bump();
            switch (esc) {
                case 'n':  tok.text += '\n'; break;
                case 't':  tok.text += '\t'; break;
                case 'r':  tok.text += '\r'; break;
                case '0':  tok.text += '\0'; break;
                case '"':  tok.text += '"'; break;
                case '\\': tok.text += '\\'; break;
                default:
                    tok.text += '\\';
                    tok.text += esc;
                    break;
            }
        }
    }
};

} // anonymous namespace

std::vector<Token> Scan(std::string_view source, const std::string& origin) {
    return Scanner(source, origin).run();
}

} // namespace nbimport
