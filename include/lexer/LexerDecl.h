/**
 * Name: pyspect::lex::Lexer
 * Purpose: Tokenize one script into a flat token vector with
 *   Newline/Indent/Dedent structure.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"

namespace pyspect::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream; tokenization errors surface as exceptions::ParseError
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line;
        size_t index{0};
        int lineNo{0};
        std::vector<size_t> indentStack{0};
        std::vector<size_t> altIndentStack{0}; // same levels measured with tab size 1
        std::vector<Token> brackets{}; // open (, [, { awaiting their closer
        bool continuation{false}; // previous physical line ended with '\'
        bool logicalOpen{false}; // tokens emitted since the last Newline
    };

    State state_{};

    bool readNextLine(State& state);
    bool emitIndentTokens(State& state);
    void scanLine(State& state);
    Token scanString(State& state, size_t start, size_t quotePos, bool isBytes, bool isFString);
    Token scanNumber(State& state);
    Token scanIdentifier(State& state);
    bool scanOperator(State& state);
    void emit(State& state, TokenKind kind, size_t start, size_t end);

    void buildAll();
};

} // namespace pyspect::lex
