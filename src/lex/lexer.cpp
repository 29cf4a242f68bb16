/*
 * Webwright Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts an input line into TokenStream (operators, words,
 *              assignments, redirections). See header for details.
 */
#include <cctype>
#include <webwright/lex/lexer.hpp>
#include <webwright/util/text.hpp>

namespace webwright {

Lexer::Lexer(std::string input, LexerOptions opts) : m_input(std::move(input)), m_opts(opts) {}

char Lexer::peek(std::size_t ahead) const { return m_pos + ahead < m_input.size() ? m_input[m_pos + ahead] : '\0'; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

bool Lexer::starts_operator() const {
    char c = peek();
    if (c=='|'||c=='&'||c==';'||c=='<'||c=='>') return true;
    return c=='2' && peek(1)=='>';
}

Token Lexer::lex_operator() {
    std::size_t start = m_pos;
    char c = get();
    auto tok = [&](TokenKind k, const char* lx) { return Token{k, lx, start, m_pos}; };
    switch (c) {
        case '|': if (peek() == '|') { get(); return tok(TokenKind::OrIf, "||"); } return tok(TokenKind::Pipe, "|");
        case '&': if (peek() == '&') { get(); return tok(TokenKind::AndIf, "&&"); } return tok(TokenKind::Background, "&");
        case ';': return tok(TokenKind::Semi, ";");
        case '>': if (peek() == '>') { get(); return tok(TokenKind::RedirOutAppend, ">>"); } return tok(TokenKind::RedirOut, ">");
        case '<': return tok(TokenKind::RedirIn, "<");
        case '2':
            get(); // '>'
            if (peek() == '&' && peek(1) == '1') { get(); get(); return tok(TokenKind::RedirErrToOut, "2>&1"); }
            return tok(TokenKind::RedirErr, "2>");
        default: return tok(TokenKind::Invalid, "");
    }
}

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out; bool in_single=false, in_double=false;
    while (!eof()) {
        char c = peek();
        if (!in_single && !in_double) {
            if (std::isspace(static_cast<unsigned char>(c))) break;
            if (c=='|'||c=='&'||c==';'||c=='>'||c=='<') break;
            if (c=='\'') { in_single=true; get(); continue; }
            if (c=='"') { in_double=true; get(); continue; }
            if (c=='\\') { get(); if(!eof()) out.push_back(get()); continue; }
        } else if (in_single) {
            get(); if (c=='\'') { in_single=false; continue; } out.push_back(c);
            continue;
        } else {
            if (c=='"') { get(); in_double=false; continue; }
            if (c=='\\' && (peek(1)=='"'||peek(1)=='\\'||peek(1)=='$'||peek(1)=='`')) { get(); out.push_back(get()); continue; }
        }
        // $(...) and `...` are kept verbatim so operators inside never split the line
        if (c=='$' && peek(1)=='(') {
            int depth = 0;
            while (!eof()) {
                char d = get(); out.push_back(d);
                if (d=='(') ++depth;
                else if (d==')' && --depth == 0) break;
            }
            continue;
        }
        if (c=='`') {
            out.push_back(get());
            while (!eof()) { char d = get(); out.push_back(d); if (d=='`') break; }
            continue;
        }
        out.push_back(get());
    }
    Token t{TokenKind::Word, out, start, m_pos};
    if (m_opts.enable_assign_detection) t = try_assign(t);
    return t;
}

bool is_assignment_word(const std::string& lex) {
    auto eq = lex.find('=');
    if (eq==std::string::npos || eq==0) return false;
    for (std::size_t i=0;i<lex.size();++i) if (std::isspace(static_cast<unsigned char>(lex[i]))) return false;
    for (std::size_t i=0;i<eq;++i) {
        auto c = static_cast<unsigned char>(lex[i]);
        bool ok = std::isalpha(c) || c=='_' || (i>0 && std::isdigit(c));
        if (!ok) return false;
    }
    return true;
}

Token Lexer::try_assign(const Token& word) const {
    if (!is_assignment_word(word.lexeme)) return word;
    Token assign = word; assign.kind = TokenKind::Assign; return assign;
}

Token Lexer::next() {
    skip_space();
    if (eof()) return {TokenKind::Eof, "", m_pos, m_pos};
    if (starts_operator()) return lex_operator();
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts;
    while (true) {
        Token t = next();
        ts.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return ts;
}

std::vector<ListSegment> split_list(const std::string& line) {
    std::vector<ListSegment> segments;
    Lexer lx(line, {false});
    std::string op; std::size_t seg_start = 0;
    auto flush = [&](std::size_t end) {
        std::string text = trim(line.substr(seg_start, end - seg_start));
        if (!text.empty()) segments.push_back({segments.empty() ? "" : op, text});
    };
    for (auto& t : lx.run()) {
        if (t.kind == TokenKind::AndIf || t.kind == TokenKind::OrIf || t.kind == TokenKind::Semi) {
            flush(t.pos);
            op = t.lexeme; seg_start = t.end;
        } else if (t.kind == TokenKind::Eof) {
            flush(line.size());
        }
    }
    return segments;
}

std::vector<std::string> split_pipeline(const std::string& line) {
    std::vector<std::string> stages;
    Lexer lx(line, {false});
    std::size_t seg_start = 0;
    for (auto& t : lx.run()) {
        if (t.kind == TokenKind::Pipe) {
            stages.push_back(trim(line.substr(seg_start, t.pos - seg_start)));
            seg_start = t.end;
        } else if (t.kind == TokenKind::Eof) {
            stages.push_back(trim(line.substr(seg_start)));
        }
    }
    return stages;
}

} // namespace webwright
