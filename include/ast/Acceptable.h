#pragma once

#include "ast/VisitorBase.h"

namespace pyspect::ast {

// CRTP mixin that equips concrete nodes with convenient template accept()
// for ad-hoc visitors. Polymorphic accept(VisitorBase&) is provided by Node.
template <typename Derived, NodeKind K>
struct Acceptable {
    template <typename Visitor>
    void apply(Visitor& v) const { v.visit(static_cast<const Derived&>(*this)); }
    static constexpr NodeKind kNodeKind = K;
};

} // namespace pyspect::ast
