#pragma once

#include <string>
#include "ast/Node.h"
#include "ast/Acceptable.h"

namespace pyspect::ast {
    struct Alias final : Node, Acceptable<Alias, NodeKind::Alias> {
        std::string name;   // dotted module path or imported name ("*" for star imports)
        std::string asname; // empty if none
        Alias() : Node(NodeKind::Alias) {}
        Alias(std::string n, std::string a) : Node(NodeKind::Alias), name(std::move(n)), asname(std::move(a)) {}
    };
}
