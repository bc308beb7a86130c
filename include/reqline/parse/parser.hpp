/*
 * Reqline Parser Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Builds a Command from a TokenStream: verb, target, then clauses dispatched to
 *   per-key sub-grammars (include=, attach=, expect=, using=, under=, ...).
 *   Singleton clauses may appear once. Errors carry the offending position and
 *   token plus a nearest-match suggestion when one is within two edits.
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
#include <cstddef>
#include <stdexcept>
#include <string>
#include "reqline/parse/tokens.hpp"
#include "reqline/parse/ast.hpp"

namespace reqline {

class ParseError : public std::runtime_error {
public:
    ParseError(std::size_t position, std::string token, std::string message, std::string suggestion = {});
    std::size_t position() const { return m_position; }
    const std::string& token() const { return m_token; }
    const std::string& message() const { return m_message; }
    const std::string& suggestion() const { return m_suggestion; }
private:
    std::size_t m_position;
    std::string m_token;
    std::string m_message;
    std::string m_suggestion;
};

Command parse_tokens(const TokenStream& ts);

// Lexer + parse_tokens.
Command parse_command(const std::string& line);

// Single expect-grammar check ("status:200", "jsonpath:$.ok=true", ...).
ExpectCheck parse_expect_check(const std::string& text, std::size_t pos = 0);

} // namespace reqline
