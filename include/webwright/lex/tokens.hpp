/*
 * Webwright Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Token kinds produced by the lexer. Webwright does not build a syntax tree:
 *   tokens are used to find top-level operators (pipes, and-or lists) in a
 *   command line and to split built-in arguments with shell quoting rules.
 *
 * License (MIT): see lexer.hpp.
 */
#pragma once
#include <string>
#include <cstddef>
#include <vector>

namespace webwright {

enum class TokenKind {
    Word,
    AndIf,
    OrIf,
    Pipe,
    Semi,
    RedirOut,
    RedirOutAppend,
    RedirIn,
    RedirErr,
    RedirErrToOut,
    Assign,
    Background,
    Eof,
    Invalid
};

struct Token {
    TokenKind kind;
    std::string lexeme;   // quote-removed text for words
    std::size_t pos;      // offset of the first input byte
    std::size_t end;      // offset one past the last input byte
};

using TokenStream = std::vector<Token>;

inline bool is_word(TokenKind k) { return k == TokenKind::Word || k == TokenKind::Assign; }

} // namespace webwright
