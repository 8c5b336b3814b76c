/**
 * @file
 * @brief AST class definition declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"
#include "ast/Call.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"

namespace pyspect::ast {
    struct ClassDef final : Stmt, Acceptable<ClassDef, NodeKind::ClassDef>, HasBody<Stmt>, HasName {
        std::vector<std::unique_ptr<Expr>> bases;       // positional bases
        std::vector<KeywordArg> keywords;               // metaclass=..., **kw
        std::vector<std::unique_ptr<Expr>> decorators;  // decorator expressions
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}
    };
}
