// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include "domains/df_type_ops.hpp"
#include "domains/df_types.hpp"

namespace dftypes::ops {

// Nullability of references: not_null and nullable are incomparable, both below unknown.

static bool is_super_nullability(const Nullability self, const Nullability other) {
    return self == other || self == Nullability::unknown;
}

static Nullability join_nullability(const Nullability a, const Nullability b) {
    return a == b ? a : Nullability::unknown;
}

static Nullability meet_nullability(const Nullability a, const Nullability b) {
    if (a == Nullability::unknown) {
        return b;
    }
    if (b == Nullability::unknown) {
        return a;
    }
    // not_null and nullable: the nullable side only says null is possible
    return a == b ? a : Nullability::not_null;
}

static bool is_super_mutability(const Mutability self, const Mutability other) {
    return self == other || self == Mutability::unknown;
}

static Mutability join_mutability(const Mutability a, const Mutability b) { return a == b ? a : Mutability::unknown; }

static std::optional<Mutability> meet_mutability(const Mutability a, const Mutability b) {
    if (a == Mutability::unknown) {
        return b;
    }
    if (b == Mutability::unknown || a == b) {
        return a;
    }
    return std::nullopt;
}

static bool is_super_special(const std::optional<SpecialFieldBinding>& self,
                             const std::optional<SpecialFieldBinding>& other) {
    if (!self) {
        return true;
    }
    return other && self->field == other->field && self->type->is_super_type(*other->type);
}

bool is_super_type(const ReferenceType& self, const ReferenceType& other) {
    if (self.constant && self.constant != other.constant) {
        return false;
    }
    if (self.local && !other.local) {
        return false;
    }
    return is_super_nullability(self.nullability, other.nullability) &&
           is_super_mutability(self.mutability, other.mutability) &&
           self.constraint.is_super_constraint(other.constraint) && is_super_special(self.special, other.special);
}

bool is_super_type(const ReferenceType& self, const NullType&) {
    return self.nullability != Nullability::not_null && !self.local && !self.constant;
}

DfType join(const ReferenceType& a, const ReferenceType& b) {
    if (is_super_type(a, b)) {
        return DfType{a};
    }
    if (is_super_type(b, a)) {
        return DfType{b};
    }
    ReferenceType res{.constraint = a.constraint.join(b.constraint),
                      .nullability = join_nullability(a.nullability, b.nullability),
                      .mutability = join_mutability(a.mutability, b.mutability),
                      .special = {},
                      .local = a.local && b.local,
                      .constant = {}};
    if (a.special && b.special && a.special->field == b.special->field) {
        const DfType type = a.special->type->join(*b.special->type);
        if (!type.is_top()) {
            res.special = SpecialFieldBinding{.field = a.special->field, .type = std::make_shared<const DfType>(type)};
        }
    }
    return DfType{std::move(res)};
}

DfType join(const ReferenceType& a, const NullType& b) {
    if (is_super_type(a, b)) {
        return DfType{a};
    }
    ReferenceType res = a;
    if (res.nullability == Nullability::not_null) {
        res.nullability = Nullability::unknown;
    }
    res.local = false;
    res.constant.reset();
    return DfType{std::move(res)};
}

DfType meet(const ReferenceType& a, const ReferenceType& b) {
    if (is_super_type(a, b)) {
        return DfType{b};
    }
    if (is_super_type(b, a)) {
        return DfType{a};
    }
    if (a.constant && b.constant) {
        // Two different objects.
        return DfType::bottom();
    }
    const Nullability nullability = meet_nullability(a.nullability, b.nullability);
    const TypeConstraint constraint = a.constraint.meet(b.constraint);
    if (constraint.is_bottom()) {
        // Only null satisfies both class constraints.
        if (nullability == Nullability::not_null || a.local || b.local) {
            return DfType::bottom();
        }
        return null_type();
    }
    const auto mutability = meet_mutability(a.mutability, b.mutability);
    if (!mutability) {
        return DfType::bottom();
    }
    ReferenceType res{.constraint = constraint,
                      .nullability = nullability,
                      .mutability = *mutability,
                      .special = a.special ? a.special : b.special,
                      .local = a.local || b.local,
                      .constant = a.constant ? a.constant : b.constant};
    if (a.special && b.special) {
        if (a.special->field == b.special->field) {
            const DfType type = a.special->type->meet(*b.special->type);
            if (type.is_bottom()) {
                return DfType::bottom();
            }
            res.special->type = std::make_shared<const DfType>(type);
        } else {
            // A reference has at most one special field.
            return DfType::bottom();
        }
    }
    if (res.constant && res != (a.constant ? a : b)) {
        // The other side narrows a single object: nothing remains.
        return DfType::bottom();
    }
    return DfType{std::move(res)};
}

DfType meet(const ReferenceType& a, const NullType& b) {
    if (is_super_type(a, b)) {
        return DfType{b};
    }
    return DfType::bottom();
}

DfType try_negate(const ReferenceType& t) {
    if (DfType{t} == not_null_object()) {
        return null_type();
    }
    return DfType::bottom();
}

DfType try_negate(const NullType&) { return not_null_object(); }

DfType widen(const ReferenceType& t) {
    if (t.constant && t.constant->synthesized) {
        ReferenceType res = t;
        res.constant.reset();
        return DfType{std::move(res)};
    }
    return DfType{t};
}

} // namespace dftypes::ops
