/**
 * Name: Lexer headers umbrella
 * Purpose: Provide a stable include that aggregates single-declaration headers.
 */
#pragma once

#include "lexer/TokenKind.h"
#include "lexer/Token.h"
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"
#include "lexer/StringInput.h"
#include "lexer/LexerDecl.h"
