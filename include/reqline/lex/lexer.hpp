/*
 * Reqline Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Provides lexical analysis for reqline commands. Converts an input line into a
 *   stream of Token objects handling single/double quoting, backslash escapes of the
 *   active quote, and clause values (key=value) that may contain unquoted spaces.
 *   A clause value only ends at whitespace when what follows is empty, another
 *   known clause key followed by '=', or a bare flag word. Lexing never fails;
 *   malformed input surfaces as a parse error later.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "reqline/parse/tokens.hpp"

namespace reqline {

struct LexerOptions {
    bool decompose_typed_values = true; // split with=json:{...} into type_tag/typed_value
};

class Lexer {
public:
    Lexer(std::string input, LexerOptions opts = {});
    TokenStream run();
private:
    Token next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();
    Token lex_word();
    Token lex_clause(std::size_t start, std::string key);
    bool is_key_start(char c) const;
    bool is_key_char(char c) const;
    bool value_ends_here(bool value_closed_quote) const;
    void decompose(Token& t) const;

    std::string m_input;
    LexerOptions m_opts;
    std::size_t m_pos = 0; // current index
};

} // namespace reqline
