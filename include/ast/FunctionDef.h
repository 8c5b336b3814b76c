#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasParams.h"
#include "ast/HasName.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace pyspect::ast {
    struct FunctionDef final : Stmt, Acceptable<FunctionDef, NodeKind::FunctionDef>, HasBody<Stmt>, HasParams<Param>, HasName {
        std::unique_ptr<Expr> returns{}; // optional return annotation
        std::vector<std::unique_ptr<Expr>> decorators; // decorator expressions, source order
        bool isAsync{false};
        explicit FunctionDef(std::string n) : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}
    };

} // namespace pyspect::ast
