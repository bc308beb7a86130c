/*
 * Reqline Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Token kinds and the Token structure shared by the lexer and parser. A command
 *   line is a sequence of bare words (verb, session subcommand, host), URLs, bare
 *   flags and key=value clauses.
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
#include <cstddef>
#include <vector>

namespace reqline {

enum class TokenKind {
    Word,
    Url,
    Flag,
    Clause,
    Eof
};

struct Token {
    TokenKind kind;
    std::string lexeme;         // word/url/flag text, or the clause key
    std::size_t pos;            // byte offset in the input line
    std::string value;          // Clause: value, outer quotes removed
    bool quoted = false;        // Clause: value was one quoted region
    bool value_is_url = false;  // Clause: value starts with http:// or https://
    std::string type_tag;       // Clause: "json" for with=json:{...}
    std::string typed_value;    // Clause: text after "type_tag:", unquoted
};

using TokenStream = std::vector<Token>;

} // namespace reqline
