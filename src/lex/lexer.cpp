/*
 * Reqline Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts a command line into a TokenStream (words, URLs, flags,
 *              key=value clauses). See header for details.
 */
#include <cctype>
#include <reqline/lex/lexer.hpp>
#include <reqline/parse/grammar.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/url.hpp>

namespace reqline {

Lexer::Lexer(std::string input, LexerOptions opts) : m_input(std::move(input)), m_opts(opts) {}

char Lexer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

bool Lexer::is_key_start(char c) const { return std::isalpha(static_cast<unsigned char>(c)); }
bool Lexer::is_key_char(char c) const { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-'; }

bool Lexer::value_ends_here(bool after_quoted_value) const {
    if (after_quoted_value) return true;
    std::size_t i = m_pos;
    while (i < m_input.size() && std::isspace(static_cast<unsigned char>(m_input[i]))) ++i;
    if (i >= m_input.size()) return true;
    std::size_t j = i;
    while (j < m_input.size() && is_key_char(m_input[j])) ++j;
    if (j == i) return false;
    std::string word = m_input.substr(i, j - i);
    if (j < m_input.size() && m_input[j] == '=') return is_clause_key(word);
    bool word_ends = j >= m_input.size() || std::isspace(static_cast<unsigned char>(m_input[j]));
    return word_ends && is_flag_word(word);
}

void Lexer::decompose(Token& t) const {
    if (t.quoted || t.value_is_url || t.value.empty()) return;
    if (t.value[0] == '{' || t.value[0] == '[') return;
    std::size_t i = 0;
    if (!is_key_start(t.value[0])) return;
    while (i < t.value.size() && is_key_char(t.value[i])) ++i;
    if (i >= t.value.size() || t.value[i] != ':') return;
    t.type_tag = t.value.substr(0, i);
    std::string rest = t.value.substr(i + 1);
    std::size_t b = 0; while (b < rest.size() && std::isspace(static_cast<unsigned char>(rest[b]))) ++b;
    t.typed_value = unquote(rest.substr(b));
}

Token Lexer::lex_clause(std::size_t start, std::string key) {
    std::string raw; char quote = 0;
    while (!eof()) {
        char c = peek();
        if (quote) {
            if (c == '\\' && m_pos + 1 < m_input.size() && (m_input[m_pos+1] == quote || m_input[m_pos+1] == '\\')) {
                raw.push_back(get()); raw.push_back(get()); continue;
            }
            if (c == quote) quote = 0;
            raw.push_back(get());
            continue;
        }
        if (c == '\'' || c == '"') { quote = c; raw.push_back(get()); continue; }
        if (std::isspace(static_cast<unsigned char>(c))) {
            bool whole = false;
            if (!raw.empty()) unquote(raw, &whole);
            if (value_ends_here(whole)) break;
            if (raw.empty()) { get(); continue; } // "key= value"
        }
        raw.push_back(get());
    }
    Token t{TokenKind::Clause, std::move(key), start};
    bool q = false;
    t.value = unquote(raw, &q);
    t.quoted = q;
    t.value_is_url = looks_like_url(t.value);
    if (m_opts.decompose_typed_values) decompose(t);
    return t;
}

Token Lexer::lex_word() {
    std::size_t start = m_pos;
    if (is_key_start(peek())) {
        std::size_t j = m_pos;
        while (j < m_input.size() && is_key_char(m_input[j])) ++j;
        if (j < m_input.size() && m_input[j] == '=') {
            std::string key = m_input.substr(m_pos, j - m_pos);
            m_pos = j + 1;
            return lex_clause(start, std::move(key));
        }
    }
    std::string out; char quote = 0;
    while (!eof()) {
        char c = peek();
        if (!quote) {
            if (std::isspace(static_cast<unsigned char>(c))) break;
            if (c == '\'' || c == '"') { quote = c; get(); continue; }
            out.push_back(get());
        } else {
            get();
            if (c == quote) { quote = 0; continue; }
            if (c == '\\' && !eof() && (peek() == quote || peek() == '\\')) { out.push_back(get()); continue; }
            out.push_back(c);
        }
    }
    if (looks_like_url(out)) return {TokenKind::Url, out, start};
    if (is_flag_word(out)) return {TokenKind::Flag, out, start};
    return {TokenKind::Word, out, start};
}

Token Lexer::next() {
    skip_space();
    if (eof()) return {TokenKind::Eof, "", m_pos};
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts; while (true) { Token t = next(); ts.push_back(t); if (t.kind == TokenKind::Eof) break; }
    return ts;
}

} // namespace reqline
