/*
 * Webwright Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Converts a command line into a stream of Token objects handling quoting,
 *   escaping, $(...) and `...` substitutions, operators (|, &&, ||, ;, &, >, >>,
 *   <, 2>, 2>&1) and assignment detection (NAME=VALUE). On top of the token
 *   stream it offers the splitting helpers the executor needs: pipeline stages
 *   and and-or list segments.
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
#include "webwright/lex/tokens.hpp"

namespace webwright {

struct LexerOptions {
    bool enable_assign_detection = true; // treat NAME=VALUE as a single token
};

class Lexer {
public:
    Lexer(std::string input, LexerOptions opts = {});
    TokenStream run();
private:
    Token next();
    char peek(std::size_t ahead = 0) const;
    char get();
    bool eof() const;
    void skip_space();
    Token lex_word();
    Token lex_operator();
    bool starts_operator() const;
    Token try_assign(const Token& word) const;

    std::string m_input;
    LexerOptions m_opts;
    std::size_t m_pos = 0; // current index
};

// NAME=VALUE where NAME is [A-Za-z_][A-Za-z0-9_]* and the word has no whitespace.
bool is_assignment_word(const std::string& word);

// One element of an and-or list; `op` is the operator that precedes it
// ("" for the first segment, otherwise "&&", "||" or ";").
struct ListSegment {
    std::string op;
    std::string text;
};

// Splits at top-level &&, || and ; (quoted or substituted text is never split).
std::vector<ListSegment> split_list(const std::string& line);

// Splits at top-level single '|'. Returns one element when there is no pipe.
std::vector<std::string> split_pipeline(const std::string& line);

} // namespace webwright
