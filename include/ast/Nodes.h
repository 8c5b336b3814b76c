/**
 * @file
 * @brief Umbrella include for every concrete AST node.
 */
#pragma once

#include "ast/Module.h"
#include "ast/FunctionDef.h"
#include "ast/ClassDef.h"
#include "ast/Import.h"
#include "ast/ImportFrom.h"
#include "ast/Alias.h"
#include "ast/ExprStmt.h"
#include "ast/AssignStmt.h"
#include "ast/AnnAssignStmt.h"
#include "ast/AugAssignStmt.h"
#include "ast/ReturnStmt.h"
#include "ast/PassStmt.h"
#include "ast/BreakStmt.h"
#include "ast/ContinueStmt.h"
#include "ast/RaiseStmt.h"
#include "ast/GlobalStmt.h"
#include "ast/NonlocalStmt.h"
#include "ast/DelStmt.h"
#include "ast/AssertStmt.h"
#include "ast/TypeAliasStmt.h"
#include "ast/IfStmt.h"
#include "ast/WhileStmt.h"
#include "ast/ForStmt.h"
#include "ast/TryStmt.h"
#include "ast/ExceptHandler.h"
#include "ast/WithStmt.h"
#include "ast/WithItem.h"
#include "ast/MatchStmt.h"
#include "ast/Name.h"
#include "ast/IntLiteral.h"
#include "ast/FloatLiteral.h"
#include "ast/ImagLiteral.h"
#include "ast/StringLiteral.h"
#include "ast/BytesLiteral.h"
#include "ast/FStringLiteral.h"
#include "ast/BoolLiteral.h"
#include "ast/NoneLiteral.h"
#include "ast/EllipsisLiteral.h"
#include "ast/Attribute.h"
#include "ast/Subscript.h"
#include "ast/Slice.h"
#include "ast/Starred.h"
#include "ast/Call.h"
#include "ast/Binary.h"
#include "ast/Unary.h"
#include "ast/Compare.h"
#include "ast/IfExpr.h"
#include "ast/LambdaExpr.h"
#include "ast/NamedExpr.h"
#include "ast/AwaitExpr.h"
#include "ast/YieldExpr.h"
#include "ast/TupleLiteral.h"
#include "ast/ListLiteral.h"
#include "ast/SetLiteral.h"
#include "ast/DictLiteral.h"
#include "ast/Comprehension.h"
