/**
 * Name: pyspect::lex::StringInput
 * Purpose: In-memory input source over script text already read from disk.
 */
#pragma once

#include <cstddef>
#include <string>
#include "lexer/InputSource.h"

namespace pyspect::lex {

class StringInput : public InputSource {
public:
    StringInput(std::string text, std::string name);

    bool getline(std::string& out) override;

    const std::string& name() const override { return name_; }

private:
    std::string text_{};
    std::string name_{};
    size_t offset_{0};
    bool done_{false};
};

} // namespace pyspect::lex
