#include "capsule/parser.h"
#include "capsule/errors.h"

#include <algorithm>

namespace capsule {

const char* op_symbol(Op op) {
    switch (op) {
        case Op::ADD:       return "+";
        case Op::SUB:       return "-";
        case Op::MUL:       return "*";
        case Op::DIV:       return "/";
        case Op::FLOOR_DIV: return "//";
        case Op::MOD:       return "%";
        case Op::POW:       return "**";
        case Op::NEG:       return "-";
        case Op::PLUS:      return "+";
        case Op::NOT:       return "not";
        case Op::AND:       return "and";
        case Op::OR:        return "or";
        case Op::EQ:        return "==";
        case Op::NE:        return "!=";
        case Op::LT:        return "<";
        case Op::LE:        return "<=";
        case Op::GT:        return ">";
        case Op::GE:        return ">=";
        case Op::IN:        return "in";
        case Op::NOT_IN:    return "not in";
    }
    return "?";
}

std::unique_ptr<Program> parse_program(const std::string& src) {
    Parser p(tokenize(src));
    return p.parse();
}

static Pos pos_of(const Token& t) { return Pos{t.line, t.col}; }

Parser::DepthGuard::DepthGuard(Parser& parser) : p(parser) {
    if (++p.depth_ > kMaxParseDepth) {
        // The destructor will not run for a throwing constructor.
        p.depth_--;
        p.fail(p.peek(), "nesting too deep");
    }
}

void Parser::ChainGuard::step() {
    added++;
    if (++p.depth_ > kMaxParseDepth) p.fail(p.peek(), "expression too deeply nested");
}

const Token& Parser::peek(size_t ahead) const {
    size_t i = std::min(pos_ + ahead, toks_.size() - 1);
    return toks_[i];
}

const Token& Parser::advance() {
    const Token& t = toks_[pos_];
    if (pos_ + 1 < toks_.size()) pos_++;
    return t;
}

bool Parser::match(Tok t) {
    if (!check(t)) return false;
    advance();
    return true;
}

const Token& Parser::expect(Tok t, const char* what) {
    if (!check(t)) {
        fail(peek(), std::string("expected ") + what + ", got " + tok_name(peek().type));
    }
    return advance();
}

void Parser::fail(const Token& at, const std::string& msg) const {
    throw SyntaxError(at.line, at.col, msg);
}

void Parser::skip_newlines() {
    while (check(Tok::NEWLINE)) advance();
}

void Parser::skip_terminators() {
    while (check(Tok::NEWLINE) || check(Tok::SEMI)) advance();
}

void Parser::end_statement() {
    if (match(Tok::SEMI) || match(Tok::NEWLINE)) return;
    if (check(Tok::END) || check(Tok::RBRACE)) return;
    fail(peek(), std::string("expected end of statement, got ") + tok_name(peek().type));
}

std::unique_ptr<Program> Parser::parse() {
    auto prog = std::make_unique<Program>();
    while (true) {
        skip_terminators();
        if (check(Tok::END)) break;
        prog->body.push_back(statement());
    }
    return prog;
}

// ---- statements ----

StmtPtr Parser::statement() {
    DepthGuard g(*this);
    switch (peek().type) {
        case Tok::LET:    return let_statement();
        case Tok::IF:     return if_statement();
        case Tok::WHILE:  return while_statement();
        case Tok::FOR:    return for_statement();
        case Tok::RETURN: return return_statement();
        case Tok::IMPORT:
        case Tok::FROM:   return import_statement();
        case Tok::FN:
            if (peek(1).type == Tok::IDENT) return fn_statement();
            return expression_statement();
        case Tok::BREAK:
        case Tok::CONTINUE: {
            const Token& t = advance();
            if (loop_depth_ == 0) fail(t, std::string(tok_name(t.type)) + " outside loop");
            auto s = std::make_unique<SimpleStmt>(t.type == Tok::BREAK ? StmtKind::BREAK : StmtKind::CONTINUE, pos_of(t));
            end_statement();
            return s;
        }
        default:
            return expression_statement();
    }
}

Block Parser::block() {
    expect(Tok::LBRACE, "'{'");
    Block body;
    while (true) {
        skip_terminators();
        if (check(Tok::RBRACE)) break;
        if (check(Tok::END)) fail(peek(), "expected '}' before end of input");
        body.push_back(statement());
    }
    expect(Tok::RBRACE, "'}'");
    return body;
}

StmtPtr Parser::let_statement() {
    Pos p = pos_of(advance());
    std::string name = expect(Tok::IDENT, "a name after 'let'").text;
    expect(Tok::ASSIGN, "'='");
    auto s = std::make_unique<LetStmt>(p, std::move(name), expression());
    end_statement();
    return s;
}

StmtPtr Parser::fn_statement() {
    Pos p = pos_of(advance());
    auto fn = std::make_unique<FnExpr>(p);
    fn->name = expect(Tok::IDENT, "a function name").text;
    fn->params = params();
    function_body(*fn);
    return std::make_unique<FnDefStmt>(p, std::move(fn));
}

StmtPtr Parser::if_statement() {
    Pos p = pos_of(advance());
    auto s = std::make_unique<IfStmt>(p, expression());
    s->then_body = block();

    size_t save = pos_;
    skip_newlines();
    if (match(Tok::ELSE)) {
        if (check(Tok::IF)) {
            DepthGuard g(*this);
            s->else_body.push_back(if_statement());
        } else {
            s->else_body = block();
        }
    } else {
        pos_ = save;
    }
    return s;
}

StmtPtr Parser::while_statement() {
    Pos p = pos_of(advance());
    auto s = std::make_unique<WhileStmt>(p, expression());
    s->body = loop_body();
    return s;
}

StmtPtr Parser::for_statement() {
    Pos p = pos_of(advance());
    auto s = std::make_unique<ForStmt>(p);
    s->vars.push_back(expect(Tok::IDENT, "a loop variable").text);
    if (match(Tok::COMMA)) {
        s->vars.push_back(expect(Tok::IDENT, "a second loop variable").text);
    }
    expect(Tok::IN, "'in'");
    s->iterable = expression();
    s->body = loop_body();
    return s;
}

StmtPtr Parser::return_statement() {
    const Token& kw = advance();
    if (fn_depth_ == 0) fail(kw, "'return' outside function");
    Pos p = pos_of(kw);
    ExprPtr value;
    if (!check(Tok::NEWLINE) && !check(Tok::SEMI) && !check(Tok::END) && !check(Tok::RBRACE)) {
        value = expression();
    }
    auto s = std::make_unique<ReturnStmt>(p, std::move(value));
    end_statement();
    return s;
}

std::string Parser::dotted_name() {
    std::string name = expect(Tok::IDENT, "a module name").text;
    while (match(Tok::DOT)) {
        name += ".";
        name += expect(Tok::IDENT, "a module name").text;
    }
    return name;
}

StmtPtr Parser::import_statement() {
    const Token& kw = advance();
    Pos p = pos_of(kw);
    bool from_form = kw.type == Tok::FROM;

    auto s = std::make_unique<ImportStmt>(p, dotted_name());
    if (from_form) {
        expect(Tok::IMPORT, "'import'");
        do {
            s->names.push_back(expect(Tok::IDENT, "an imported name").text);
        } while (match(Tok::COMMA));
    } else if (match(Tok::AS)) {
        s->names.push_back(expect(Tok::IDENT, "an alias").text);
    }
    end_statement();
    return s;
}

StmtPtr Parser::expression_statement() {
    Pos p = pos_of(peek());
    ExprPtr e = expression();

    Tok t = peek().type;
    if (t == Tok::ASSIGN || t == Tok::PLUS_ASSIGN || t == Tok::MINUS_ASSIGN ||
        t == Tok::STAR_ASSIGN || t == Tok::SLASH_ASSIGN) {
        if (e->kind != ExprKind::NAME && e->kind != ExprKind::INDEX && e->kind != ExprKind::MEMBER) {
            fail(peek(), "invalid assignment target");
        }
        advance();
        skip_newlines();
        auto s = std::make_unique<AssignStmt>(p, std::move(e), expression());
        switch (t) {
            case Tok::PLUS_ASSIGN:  s->augmented = true; s->op = Op::ADD; break;
            case Tok::MINUS_ASSIGN: s->augmented = true; s->op = Op::SUB; break;
            case Tok::STAR_ASSIGN:  s->augmented = true; s->op = Op::MUL; break;
            case Tok::SLASH_ASSIGN: s->augmented = true; s->op = Op::DIV; break;
            default: break;
        }
        end_statement();
        return s;
    }

    auto s = std::make_unique<ExprStmt>(p, std::move(e));
    end_statement();
    return s;
}

// ---- expressions ----

ExprPtr Parser::expression() {
    DepthGuard g(*this);
    return or_expr();
}

ExprPtr Parser::or_expr() {
    ExprPtr lhs = and_expr();
    ChainGuard chain(*this);
    while (check(Tok::OR)) {
        chain.step();
        Pos p = pos_of(advance());
        skip_newlines();
        lhs = std::make_unique<BinaryExpr>(p, Op::OR, std::move(lhs), and_expr());
    }
    return lhs;
}

ExprPtr Parser::and_expr() {
    ExprPtr lhs = not_expr();
    ChainGuard chain(*this);
    while (check(Tok::AND)) {
        chain.step();
        Pos p = pos_of(advance());
        skip_newlines();
        lhs = std::make_unique<BinaryExpr>(p, Op::AND, std::move(lhs), not_expr());
    }
    return lhs;
}

ExprPtr Parser::not_expr() {
    if (check(Tok::NOT)) {
        DepthGuard g(*this);
        Pos p = pos_of(advance());
        return std::make_unique<UnaryExpr>(p, Op::NOT, not_expr());
    }
    return comparison();
}

ExprPtr Parser::comparison() {
    ExprPtr lhs = additive();
    ChainGuard chain(*this);
    while (true) {
        Op op;
        switch (peek().type) {
            case Tok::EQ: op = Op::EQ; break;
            case Tok::NE: op = Op::NE; break;
            case Tok::LT: op = Op::LT; break;
            case Tok::LE: op = Op::LE; break;
            case Tok::GT: op = Op::GT; break;
            case Tok::GE: op = Op::GE; break;
            case Tok::IN: op = Op::IN; break;
            case Tok::NOT:
                if (peek(1).type != Tok::IN) return lhs;
                op = Op::NOT_IN;
                break;
            default:
                return lhs;
        }
        chain.step();
        Pos p = pos_of(advance());
        if (op == Op::NOT_IN) advance();
        skip_newlines();
        lhs = std::make_unique<BinaryExpr>(p, op, std::move(lhs), additive());
    }
}

ExprPtr Parser::additive() {
    ExprPtr lhs = multiplicative();
    ChainGuard chain(*this);
    while (check(Tok::PLUS) || check(Tok::MINUS)) {
        chain.step();
        const Token& t = advance();
        Op op = t.type == Tok::PLUS ? Op::ADD : Op::SUB;
        Pos p = pos_of(t);
        skip_newlines();
        lhs = std::make_unique<BinaryExpr>(p, op, std::move(lhs), multiplicative());
    }
    return lhs;
}

ExprPtr Parser::multiplicative() {
    ExprPtr lhs = unary();
    ChainGuard chain(*this);
    while (true) {
        Op op;
        switch (peek().type) {
            case Tok::STAR:        op = Op::MUL; break;
            case Tok::SLASH:       op = Op::DIV; break;
            case Tok::SLASH_SLASH: op = Op::FLOOR_DIV; break;
            case Tok::PERCENT:     op = Op::MOD; break;
            default: return lhs;
        }
        chain.step();
        Pos p = pos_of(advance());
        skip_newlines();
        lhs = std::make_unique<BinaryExpr>(p, op, std::move(lhs), unary());
    }
}

ExprPtr Parser::unary() {
    if (check(Tok::MINUS) || check(Tok::PLUS)) {
        DepthGuard g(*this);
        const Token& t = advance();
        Op op = t.type == Tok::MINUS ? Op::NEG : Op::PLUS;
        Pos p = pos_of(t);
        return std::make_unique<UnaryExpr>(p, op, unary());
    }
    return power();
}

ExprPtr Parser::power() {
    ExprPtr base = postfix();
    if (check(Tok::STAR_STAR)) {
        DepthGuard g(*this);
        Pos p = pos_of(advance());
        skip_newlines();
        return std::make_unique<BinaryExpr>(p, Op::POW, std::move(base), unary());
    }
    return base;
}

ExprPtr Parser::postfix() {
    ExprPtr e = primary();
    ChainGuard chain(*this);
    while (true) {
        if (!check(Tok::LPAREN) && !check(Tok::LBRACKET) && !check(Tok::DOT)) return e;
        chain.step();

        const Token& t = advance();
        Pos p = pos_of(t);
        if (t.type == Tok::LPAREN) {
            auto call = std::make_unique<CallExpr>(p, std::move(e));
            while (!check(Tok::RPAREN)) {
                call->args.push_back(expression());
                if (!match(Tok::COMMA)) break;
            }
            expect(Tok::RPAREN, "')'");
            e = std::move(call);
        } else if (t.type == Tok::LBRACKET) {
            ExprPtr lo;
            if (!check(Tok::COLON)) lo = expression();
            if (match(Tok::COLON)) {
                ExprPtr hi;
                if (!check(Tok::RBRACKET)) hi = expression();
                e = std::make_unique<SliceExpr>(p, std::move(e), std::move(lo), std::move(hi));
            } else {
                e = std::make_unique<IndexExpr>(p, std::move(e), std::move(lo));
            }
            expect(Tok::RBRACKET, "']'");
        } else {
            std::string attr = expect(Tok::IDENT, "an attribute name").text;
            e = std::make_unique<MemberExpr>(p, std::move(e), std::move(attr));
        }
    }
}

ExprPtr Parser::primary() {
    const Token& t = peek();
    Pos p = pos_of(t);
    switch (t.type) {
        case Tok::INT:    advance(); return std::make_unique<LiteralExpr>(p, Value::integer(t.ival));
        case Tok::FLOAT:  advance(); return std::make_unique<LiteralExpr>(p, Value::number(t.fval));
        case Tok::STRING: advance(); return std::make_unique<LiteralExpr>(p, Value::str(t.text));
        case Tok::TRUE:   advance(); return std::make_unique<LiteralExpr>(p, Value::boolean(true));
        case Tok::FALSE:  advance(); return std::make_unique<LiteralExpr>(p, Value::boolean(false));
        case Tok::NUL:    advance(); return std::make_unique<LiteralExpr>(p, Value());
        case Tok::IDENT:  advance(); return std::make_unique<NameExpr>(p, t.text);
        case Tok::LPAREN:   return paren_or_tuple(p);
        case Tok::LBRACKET: return list_literal(p);
        case Tok::LBRACE:   return map_literal(p);
        case Tok::FN:       return lambda(p);
        default:
            break;
    }
    fail(t, std::string("unexpected ") + tok_name(t.type));
}

ExprPtr Parser::paren_or_tuple(Pos p) {
    advance();
    if (match(Tok::RPAREN)) return std::make_unique<SeqExpr>(ExprKind::TUPLE, p);

    ExprPtr first = expression();
    if (!match(Tok::COMMA)) {
        expect(Tok::RPAREN, "')'");
        return first;
    }

    auto tup = std::make_unique<SeqExpr>(ExprKind::TUPLE, p);
    tup->items.push_back(std::move(first));
    while (!check(Tok::RPAREN)) {
        tup->items.push_back(expression());
        if (!match(Tok::COMMA)) break;
    }
    expect(Tok::RPAREN, "')'");
    return tup;
}

ExprPtr Parser::list_literal(Pos p) {
    advance();
    auto list = std::make_unique<SeqExpr>(ExprKind::LIST, p);
    while (!check(Tok::RBRACKET)) {
        list->items.push_back(expression());
        if (!match(Tok::COMMA)) break;
    }
    expect(Tok::RBRACKET, "']'");
    return list;
}

ExprPtr Parser::map_literal(Pos p) {
    advance();
    auto map = std::make_unique<MapExpr>(p);
    skip_newlines();
    while (!check(Tok::RBRACE)) {
        ExprPtr key = expression();
        skip_newlines();
        expect(Tok::COLON, "':' in dict literal");
        skip_newlines();
        ExprPtr value = expression();
        map->entries.emplace_back(std::move(key), std::move(value));
        skip_newlines();
        if (!match(Tok::COMMA)) break;
        skip_newlines();
    }
    expect(Tok::RBRACE, "'}'");
    return map;
}

ExprPtr Parser::lambda(Pos p) {
    advance();
    auto fn = std::make_unique<FnExpr>(p);
    fn->params = params();
    if (match(Tok::ARROW)) {
        skip_newlines();
        fn->expr_body = expression();
    } else {
        function_body(*fn);
    }
    return fn;
}

void Parser::function_body(FnExpr& fn) {
    int saved_loops = loop_depth_;
    loop_depth_ = 0;
    fn_depth_++;
    fn.body = block();
    fn_depth_--;
    loop_depth_ = saved_loops;
}

Block Parser::loop_body() {
    loop_depth_++;
    Block body = block();
    loop_depth_--;
    return body;
}

std::vector<std::string> Parser::params() {
    expect(Tok::LPAREN, "'('");
    std::vector<std::string> out;
    while (!check(Tok::RPAREN)) {
        const Token& t = expect(Tok::IDENT, "a parameter name");
        if (std::find(out.begin(), out.end(), t.text) != out.end()) {
            fail(t, "duplicate parameter '" + t.text + "'");
        }
        out.push_back(t.text);
        if (!match(Tok::COMMA)) break;
    }
    expect(Tok::RPAREN, "')'");
    return out;
}

} // namespace capsule
