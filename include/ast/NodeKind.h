/**
 * @file
 * @brief Closed enumeration of syntax tree node kinds.
 */
#pragma once

namespace pyspect::ast {
    enum class NodeKind {
        Module,
        // statements
        FunctionDef,
        ClassDef,
        Import,
        ImportFrom,
        Alias,
        ExprStmt,
        AssignStmt,
        AnnAssignStmt,
        AugAssignStmt,
        ReturnStmt,
        PassStmt,
        BreakStmt,
        ContinueStmt,
        RaiseStmt,
        GlobalStmt,
        NonlocalStmt,
        DelStmt,
        AssertStmt,
        TypeAliasStmt,
        IfStmt,
        WhileStmt,
        ForStmt,
        TryStmt,
        ExceptHandler,
        WithStmt,
        WithItem,
        MatchStmt,
        MatchCase,
        // expressions
        Name,
        IntLiteral,
        FloatLiteral,
        ImagLiteral,
        StringLiteral,
        BytesLiteral,
        FStringLiteral,
        BoolLiteral,
        NoneLiteral,
        EllipsisLiteral,
        Attribute,
        Subscript,
        Slice,
        Starred,
        Call,
        BinaryExpr,
        UnaryExpr,
        Compare,
        IfExpr,
        LambdaExpr,
        NamedExpr,
        AwaitExpr,
        YieldExpr,
        TupleLiteral,
        ListLiteral,
        SetLiteral,
        DictLiteral,
        ListComp,
        SetComp,
        DictComp,
        GeneratorExpr
    };

    const char *to_string(NodeKind element);
} // namespace pyspect::ast
