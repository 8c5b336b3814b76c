/**
 * Name: pyspect::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace pyspect::lex {
    const char *to_string(const TokenKind k) {
        using enum pyspect::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Newline: return "Newline";
            case Indent: return "Indent";
            case Dedent: return "Dedent";
            case And: return "and";
            case As: return "as";
            case Assert: return "assert";
            case Async: return "async";
            case Await: return "await";
            case Break: return "break";
            case Class: return "class";
            case Continue: return "continue";
            case Def: return "def";
            case Del: return "del";
            case Elif: return "elif";
            case Else: return "else";
            case Except: return "except";
            case Finally: return "finally";
            case For: return "for";
            case From: return "from";
            case Global: return "global";
            case If: return "if";
            case Import: return "import";
            case In: return "in";
            case Is: return "is";
            case Lambda: return "lambda";
            case Nonlocal: return "nonlocal";
            case Not: return "not";
            case Or: return "or";
            case Pass: return "pass";
            case Raise: return "raise";
            case Return: return "return";
            case Try: return "try";
            case While: return "while";
            case With: return "with";
            case Yield: return "yield";
            case NoneLit: return "None";
            case BoolLit: return "BoolLit";
            case Arrow: return "->";
            case Colon: return ":";
            case ColonEqual: return ":=";
            case Comma: return ",";
            case Semicolon: return ";";
            case Dot: return ".";
            case Ellipsis: return "...";
            case At: return "@";
            case AtEqual: return "@=";
            case Equal: return "=";
            case Plus: return "+";
            case PlusEqual: return "+=";
            case Minus: return "-";
            case MinusEqual: return "-=";
            case Star: return "*";
            case StarEqual: return "*=";
            case StarStar: return "**";
            case StarStarEqual: return "**=";
            case Slash: return "/";
            case SlashEqual: return "/=";
            case SlashSlash: return "//";
            case SlashSlashEqual: return "//=";
            case Percent: return "%";
            case PercentEqual: return "%=";
            case LShift: return "<<";
            case LShiftEqual: return "<<=";
            case RShift: return ">>";
            case RShiftEqual: return ">>=";
            case Amp: return "&";
            case AmpEqual: return "&=";
            case Pipe: return "|";
            case PipeEqual: return "|=";
            case Caret: return "^";
            case CaretEqual: return "^=";
            case Tilde: return "~";
            case EqEq: return "==";
            case NotEq: return "!=";
            case Lt: return "<";
            case Le: return "<=";
            case Gt: return ">";
            case Ge: return ">=";
            case LParen: return "(";
            case RParen: return ")";
            case LBracket: return "[";
            case RBracket: return "]";
            case LBrace: return "{";
            case RBrace: return "}";
            case Ident: return "Ident";
            case Int: return "Int";
            case Float: return "Float";
            case Imag: return "Imag";
            case String: return "String";
            case Bytes: return "Bytes";
            case FString: return "FString";
        }
        return "?";
    }

    bool isAugAssign(const TokenKind k) {
        using enum pyspect::lex::TokenKind;
        switch (k) {
            case PlusEqual: case MinusEqual: case StarEqual: case StarStarEqual:
            case SlashEqual: case SlashSlashEqual: case PercentEqual: case AtEqual:
            case LShiftEqual: case RShiftEqual: case AmpEqual: case PipeEqual: case CaretEqual:
                return true;
            default:
                return false;
        }
    }
} // namespace pyspect::lex
