#include "capsule/lexer.h"
#include "capsule/errors.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <unordered_map>

namespace capsule {

static const std::unordered_map<std::string, Tok>& keywords() {
    static const std::unordered_map<std::string, Tok> kw = {
        {"let", Tok::LET},       {"fn", Tok::FN},         {"return", Tok::RETURN},
        {"if", Tok::IF},         {"else", Tok::ELSE},     {"while", Tok::WHILE},
        {"for", Tok::FOR},       {"in", Tok::IN},         {"break", Tok::BREAK},
        {"continue", Tok::CONTINUE},
        {"true", Tok::TRUE},     {"false", Tok::FALSE},   {"null", Tok::NUL},
        {"and", Tok::AND},       {"or", Tok::OR},         {"not", Tok::NOT},
        {"import", Tok::IMPORT}, {"from", Tok::FROM},     {"as", Tok::AS},
    };
    return kw;
}

const char* tok_name(Tok t) {
    switch (t) {
        case Tok::IDENT:        return "identifier";
        case Tok::INT:          return "integer";
        case Tok::FLOAT:        return "float";
        case Tok::STRING:       return "string";
        case Tok::NEWLINE:      return "newline";
        case Tok::END:          return "end of input";
        case Tok::LPAREN:       return "'('";
        case Tok::RPAREN:       return "')'";
        case Tok::LBRACKET:     return "'['";
        case Tok::RBRACKET:     return "']'";
        case Tok::LBRACE:       return "'{'";
        case Tok::RBRACE:       return "'}'";
        case Tok::COMMA:        return "','";
        case Tok::DOT:          return "'.'";
        case Tok::COLON:        return "':'";
        case Tok::SEMI:         return "';'";
        case Tok::ARROW:        return "'=>'";
        case Tok::ASSIGN:       return "'='";
        case Tok::PLUS_ASSIGN:  return "'+='";
        case Tok::MINUS_ASSIGN: return "'-='";
        case Tok::STAR_ASSIGN:  return "'*='";
        case Tok::SLASH_ASSIGN: return "'/='";
        case Tok::PLUS:         return "'+'";
        case Tok::MINUS:        return "'-'";
        case Tok::STAR:         return "'*'";
        case Tok::SLASH:        return "'/'";
        case Tok::SLASH_SLASH:  return "'//'";
        case Tok::PERCENT:      return "'%'";
        case Tok::STAR_STAR:    return "'**'";
        case Tok::EQ:           return "'=='";
        case Tok::NE:           return "'!='";
        case Tok::LT:           return "'<'";
        case Tok::LE:           return "'<='";
        case Tok::GT:           return "'>'";
        case Tok::GE:           return "'>='";
        case Tok::LET:          return "'let'";
        case Tok::FN:           return "'fn'";
        case Tok::RETURN:       return "'return'";
        case Tok::IF:           return "'if'";
        case Tok::ELSE:         return "'else'";
        case Tok::WHILE:        return "'while'";
        case Tok::FOR:          return "'for'";
        case Tok::IN:           return "'in'";
        case Tok::BREAK:        return "'break'";
        case Tok::CONTINUE:     return "'continue'";
        case Tok::TRUE:         return "'true'";
        case Tok::FALSE:        return "'false'";
        case Tok::NUL:          return "'null'";
        case Tok::AND:          return "'and'";
        case Tok::OR:           return "'or'";
        case Tok::NOT:          return "'not'";
        case Tok::IMPORT:       return "'import'";
        case Tok::FROM:         return "'from'";
        case Tok::AS:           return "'as'";
    }
    return "token";
}

namespace {

class Scanner {
public:
    explicit Scanner(const std::string& src) : src_(src) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        while (true) {
            skip_space_and_comments();
            if (at_end()) break;

            Token t;
            t.line = line_;
            t.col = col_;
            char c = peek();

            if (c == '\n') {
                advance();
                bool significant = brackets_.empty() || brackets_.back() == '{';
                if (significant && !out.empty() && out.back().type != Tok::NEWLINE) {
                    t.type = Tok::NEWLINE;
                    out.push_back(t);
                }
                continue;
            }

            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                scan_identifier(t);
            } else if (std::isdigit(static_cast<unsigned char>(c))) {
                scan_number(t);
            } else if (c == '"' || c == '\'') {
                scan_string(t);
            } else {
                scan_operator(t);
            }
            out.push_back(std::move(t));
        }

        Token end;
        end.type = Tok::END;
        end.line = line_;
        end.col = col_;
        out.push_back(end);
        return out;
    }

private:
    const std::string& src_;
    size_t pos_{0};
    int line_{1};
    int col_{1};
    std::vector<char> brackets_;  // open ( [ { in source order

    bool at_end() const { return pos_ >= src_.size(); }
    char peek(size_t ahead = 0) const { return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0'; }

    char advance() {
        char c = src_[pos_++];
        if (c == '\n') { line_++; col_ = 1; }
        else col_++;
        return c;
    }

    [[noreturn]] void fail(const std::string& msg) const { throw SyntaxError(line_, col_, msg); }

    void skip_space_and_comments() {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r') {
                advance();
            } else if (c == '#') {
                while (!at_end() && peek() != '\n') advance();
            } else if (c == '\\' && peek(1) == '\n') {
                advance();
                advance();
            } else {
                break;
            }
        }
    }

    void scan_identifier(Token& t) {
        size_t start = pos_;
        while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) advance();
        t.text = src_.substr(start, pos_ - start);
        auto it = keywords().find(t.text);
        t.type = it == keywords().end() ? Tok::IDENT : it->second;
    }

    void scan_number(Token& t) {
        size_t start = pos_;
        bool is_float = false;
        while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') advance();
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
            is_float = true;
            advance();
            while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
        }
        if (peek() == 'e' || peek() == 'E') {
            size_t save_pos = pos_;
            int save_col = col_;
            advance();
            if (peek() == '+' || peek() == '-') advance();
            if (std::isdigit(static_cast<unsigned char>(peek()))) {
                is_float = true;
                while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
            } else {
                pos_ = save_pos;
                col_ = save_col;
            }
        }
        if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_') {
            fail("invalid numeric literal");
        }

        std::string digits;
        for (size_t i = start; i < pos_; i++) {
            if (src_[i] != '_') digits.push_back(src_[i]);
        }

        errno = 0;
        if (is_float) {
            t.type = Tok::FLOAT;
            t.fval = std::strtod(digits.c_str(), nullptr);
        } else {
            t.type = Tok::INT;
            t.ival = std::strtoll(digits.c_str(), nullptr, 10);
            if (errno == ERANGE) fail("integer literal out of range");
        }
        t.text = digits;
    }

    void scan_string(Token& t) {
        char quote = advance();
        std::string out;
        while (true) {
            if (at_end() || peek() == '\n') fail("unterminated string literal");
            char c = advance();
            if (c == quote) break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (at_end()) fail("unterminated string literal");
            char e = advance();
            switch (e) {
                case 'n':  out.push_back('\n'); break;
                case 't':  out.push_back('\t'); break;
                case 'r':  out.push_back('\r'); break;
                case '0':  out.push_back('\0'); break;
                case '\\': out.push_back('\\'); break;
                case '\'': out.push_back('\''); break;
                case '"':  out.push_back('"'); break;
                default:
                    fail(std::string("unknown escape sequence '\\") + e + "'");
            }
        }
        t.type = Tok::STRING;
        t.text = std::move(out);
    }

    // Mismatched closers are left for the parser to report.
    void close_bracket() {
        if (!brackets_.empty()) brackets_.pop_back();
    }

    void scan_operator(Token& t) {
        char c = advance();
        switch (c) {
            case '(': brackets_.push_back(c); t.type = Tok::LPAREN; return;
            case ')': close_bracket(); t.type = Tok::RPAREN; return;
            case '[': brackets_.push_back(c); t.type = Tok::LBRACKET; return;
            case ']': close_bracket(); t.type = Tok::RBRACKET; return;
            case '{': brackets_.push_back(c); t.type = Tok::LBRACE; return;
            case '}': close_bracket(); t.type = Tok::RBRACE; return;
            case ',': t.type = Tok::COMMA; return;
            case '.': t.type = Tok::DOT; return;
            case ':': t.type = Tok::COLON; return;
            case ';': t.type = Tok::SEMI; return;
            case '%': t.type = Tok::PERCENT; return;
            case '+':
                if (peek() == '=') { advance(); t.type = Tok::PLUS_ASSIGN; return; }
                t.type = Tok::PLUS; return;
            case '-':
                if (peek() == '=') { advance(); t.type = Tok::MINUS_ASSIGN; return; }
                t.type = Tok::MINUS; return;
            case '*':
                if (peek() == '*') { advance(); t.type = Tok::STAR_STAR; return; }
                if (peek() == '=') { advance(); t.type = Tok::STAR_ASSIGN; return; }
                t.type = Tok::STAR; return;
            case '/':
                if (peek() == '/') { advance(); t.type = Tok::SLASH_SLASH; return; }
                if (peek() == '=') { advance(); t.type = Tok::SLASH_ASSIGN; return; }
                t.type = Tok::SLASH; return;
            case '=':
                if (peek() == '=') { advance(); t.type = Tok::EQ; return; }
                if (peek() == '>') { advance(); t.type = Tok::ARROW; return; }
                t.type = Tok::ASSIGN; return;
            case '!':
                if (peek() == '=') { advance(); t.type = Tok::NE; return; }
                break;
            case '<':
                if (peek() == '=') { advance(); t.type = Tok::LE; return; }
                t.type = Tok::LT; return;
            case '>':
                if (peek() == '=') { advance(); t.type = Tok::GE; return; }
                t.type = Tok::GT; return;
            default:
                break;
        }
        throw SyntaxError(t.line, t.col, std::string("unexpected character '") + c + "'");
    }
};

} // namespace

std::vector<Token> tokenize(const std::string& src) {
    Scanner s(src);
    return s.run();
}

} // namespace capsule
