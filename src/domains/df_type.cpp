// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <charconv>
#include <sstream>
#include <type_traits>

#include <boost/container_hash/hash.hpp>

#include "domains/df_type.hpp"
#include "domains/df_type_ops.hpp"
#include "domains/df_types.hpp"

namespace dftypes {

bool SpecialFieldBinding::operator==(const SpecialFieldBinding& o) const {
    return field == o.field && *type == *o.type;
}

namespace {

// Every same-family pair has its own overload; the templates only cover pairs of different families.

struct SuperTypeVisitor {
    bool operator()(const TopType&, const TopType&) const { return true; }
    bool operator()(const BottomType&, const BottomType&) const { return true; }
    bool operator()(const BooleanType& a, const BooleanType& b) const { return ops::is_super_type(a, b); }
    bool operator()(const IntType& a, const IntType& b) const { return ops::is_super_type(a, b); }
    bool operator()(const LongType& a, const LongType& b) const { return ops::is_super_type(a, b); }
    bool operator()(const FloatType& a, const FloatType& b) const { return ops::is_super_type(a, b); }
    bool operator()(const DoubleType& a, const DoubleType& b) const { return ops::is_super_type(a, b); }
    bool operator()(const NullType&, const NullType&) const { return true; }
    bool operator()(const ReferenceType& a, const ReferenceType& b) const { return ops::is_super_type(a, b); }
    bool operator()(const ReferenceType& a, const NullType& b) const { return ops::is_super_type(a, b); }

    // Different families are incomparable.
    template <typename A, typename B>
        requires(!std::is_same_v<A, B>)
    bool operator()(const A&, const B&) const {
        return false;
    }
};

struct JoinVisitor {
    DfType operator()(const TopType&, const TopType&) const { return DfType::top(); }
    DfType operator()(const BottomType&, const BottomType&) const { return DfType::bottom(); }
    DfType operator()(const BooleanType& a, const BooleanType& b) const { return ops::join(a, b); }
    DfType operator()(const IntType& a, const IntType& b) const { return ops::join(a, b); }
    DfType operator()(const LongType& a, const LongType& b) const { return ops::join(a, b); }
    DfType operator()(const FloatType& a, const FloatType& b) const { return ops::join(a, b); }
    DfType operator()(const DoubleType& a, const DoubleType& b) const { return ops::join(a, b); }
    DfType operator()(const NullType& a, const NullType&) const { return DfType{a}; }
    DfType operator()(const ReferenceType& a, const ReferenceType& b) const { return ops::join(a, b); }
    DfType operator()(const ReferenceType& a, const NullType& b) const { return ops::join(a, b); }
    DfType operator()(const NullType& a, const ReferenceType& b) const { return ops::join(b, a); }

    template <typename A, typename B>
        requires(!std::is_same_v<A, B>)
    DfType operator()(const A&, const B&) const {
        return DfType::top();
    }
};

struct MeetVisitor {
    DfType operator()(const TopType&, const TopType&) const { return DfType::top(); }
    DfType operator()(const BottomType&, const BottomType&) const { return DfType::bottom(); }
    DfType operator()(const BooleanType& a, const BooleanType& b) const { return ops::meet(a, b); }
    DfType operator()(const IntType& a, const IntType& b) const { return ops::meet(a, b); }
    DfType operator()(const LongType& a, const LongType& b) const { return ops::meet(a, b); }
    DfType operator()(const FloatType& a, const FloatType& b) const { return ops::meet(a, b); }
    DfType operator()(const DoubleType& a, const DoubleType& b) const { return ops::meet(a, b); }
    DfType operator()(const NullType& a, const NullType&) const { return DfType{a}; }
    DfType operator()(const ReferenceType& a, const ReferenceType& b) const { return ops::meet(a, b); }
    DfType operator()(const ReferenceType& a, const NullType& b) const { return ops::meet(a, b); }
    DfType operator()(const NullType& a, const ReferenceType& b) const { return ops::meet(b, a); }

    template <typename A, typename B>
        requires(!std::is_same_v<A, B>)
    DfType operator()(const A&, const B&) const {
        return DfType::bottom();
    }
};

struct NegateVisitor {
    DfType operator()(const TopType&) const { return DfType::bottom(); }
    DfType operator()(const BottomType&) const { return DfType::top(); }
    DfType operator()(const BooleanType& t) const { return ops::try_negate(t); }
    DfType operator()(const IntType& t) const { return ops::try_negate(t); }
    DfType operator()(const LongType& t) const { return ops::try_negate(t); }
    DfType operator()(const FloatType& t) const { return ops::try_negate(t); }
    DfType operator()(const DoubleType& t) const { return ops::try_negate(t); }
    DfType operator()(const NullType& t) const { return ops::try_negate(t); }
    DfType operator()(const ReferenceType& t) const { return ops::try_negate(t); }
};

struct WidenVisitor {
    DfType operator()(const IntType& t) const { return ops::widen(t); }
    DfType operator()(const LongType& t) const { return ops::widen(t); }
    DfType operator()(const ReferenceType& t) const { return ops::widen(t); }

    template <typename T>
    DfType operator()(const T& t) const {
        return DfType{t};
    }
};

} // namespace

bool DfType::is_super_type(const DfType& other) const {
    if (other.is_bottom() || is_top()) {
        return true;
    }
    if (is_bottom() || other.is_top()) {
        return false;
    }
    return std::visit(SuperTypeVisitor{}, _v, other._v);
}

DfType DfType::join(const DfType& other) const {
    if (is_bottom() || other.is_top()) {
        return other;
    }
    if (other.is_bottom() || is_top()) {
        return *this;
    }
    return std::visit(JoinVisitor{}, _v, other._v);
}

DfType DfType::meet(const DfType& other) const {
    if (is_top() || other.is_bottom()) {
        return other;
    }
    if (other.is_top() || is_bottom()) {
        return *this;
    }
    return std::visit(MeetVisitor{}, _v, other._v);
}

DfType DfType::try_negate() const { return std::visit(NegateVisitor{}, _v); }

DfType DfType::widen() const { return std::visit(WidenVisitor{}, _v); }

std::size_t hash_value(const DfType& t) {
    std::size_t seed = t._v.index();
    std::visit(
        [&seed](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, BooleanType>) {
                boost::hash_combine(seed, v.value ? (*v.value ? 2 : 1) : 0);
            } else if constexpr (std::is_same_v<T, IntType> || std::is_same_v<T, LongType>) {
                boost::hash_combine(seed, hash_value(v.range));
            } else if constexpr (std::is_same_v<T, FloatType> || std::is_same_v<T, DoubleType>) {
                boost::hash_combine(seed, static_cast<int>(v.kind));
                if (v.kind == FloatKind::constant) {
                    boost::hash_combine(seed, canonical_bits(v.value));
                }
                boost::hash_range(seed, v.excluded.begin(), v.excluded.end());
            } else if constexpr (std::is_same_v<T, ReferenceType>) {
                boost::hash_combine(seed, hash_value(v.constraint));
                boost::hash_combine(seed, static_cast<int>(v.nullability));
                boost::hash_combine(seed, static_cast<int>(v.mutability));
                if (v.special) {
                    boost::hash_combine(seed, static_cast<int>(v.special->field));
                    boost::hash_combine(seed, hash_value(*v.special->type));
                }
                boost::hash_combine(seed, v.local);
                if (v.constant) {
                    boost::hash_combine(seed, hash_value(v.constant->value));
                    boost::hash_combine(seed, v.constant->synthesized);
                }
            }
        },
        t._v);
    return seed;
}

// Shortest round-trip representation, always showing it is a floating point number.
template <std::floating_point F>
static void print_float(std::ostream& o, const F v) {
    char buf[64];
    const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    std::string s(buf, ec == std::errc{} ? end : buf);
    if (s.find_first_of(".enai") == std::string::npos) {
        s += ".0";
    }
    o << s;
}

template <std::floating_point F>
static void print_floating(std::ostream& o, const FloatingType<F>& t, const char* name, const char* suffix) {
    switch (t.kind) {
    case FloatKind::any: o << name; break;
    case FloatKind::zero: o << name << " 0.0 or -0.0"; break;
    case FloatKind::constant:
        print_float(o, t.value);
        o << suffix;
        break;
    case FloatKind::not_value: {
        o << name << " !=";
        bool first = true;
        for (const auto bits : t.excluded) {
            o << (first ? " " : ", ");
            first = false;
            print_float(o, from_bits<F>(bits));
        }
        break;
    }
    }
}

template <int W>
static void print_integral(std::ostream& o, const IntegralType<W>& t, const char* name, const char* suffix) {
    if (const auto n = t.range.constant_value()) {
        o << *n << suffix;
    } else if (t.range == IntegralType<W>::domain()) {
        o << name;
    } else {
        o << name << " " << t.range;
    }
}

static void print_reference(std::ostream& o, const ReferenceType& t) {
    if (t.constant) {
        o << t.constant->value;
        return;
    }
    std::vector<std::string> parts;
    auto add = [&parts](const auto& item) {
        std::ostringstream s;
        s << item;
        if (!s.str().empty()) {
            parts.push_back(s.str());
        }
    };
    if (t.nullability != Nullability::unknown) {
        add(t.nullability);
    }
    add(t.constraint);
    if (t.mutability != Mutability::unknown) {
        add(t.mutability);
    }
    if (t.local) {
        add("local object");
    }
    if (t.special) {
        std::ostringstream s;
        s << t.special->field << "=" << *t.special->type;
        add(s.str());
    }
    if (parts.empty()) {
        o << "Object";
        return;
    }
    for (size_t i = 0; i < parts.size(); i++) {
        o << (i == 0 ? "" : " ") << parts[i];
    }
}

std::ostream& operator<<(std::ostream& o, const DfType& t) {
    std::visit(
        [&o](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, TopType>) {
                o << "TOP";
            } else if constexpr (std::is_same_v<T, BottomType>) {
                o << "BOTTOM";
            } else if constexpr (std::is_same_v<T, BooleanType>) {
                o << (v.value ? (*v.value ? "true" : "false") : "boolean");
            } else if constexpr (std::is_same_v<T, IntType>) {
                print_integral(o, v, "int", "");
            } else if constexpr (std::is_same_v<T, LongType>) {
                print_integral(o, v, "long", "L");
            } else if constexpr (std::is_same_v<T, FloatType>) {
                print_floating(o, v, "float", "f");
            } else if constexpr (std::is_same_v<T, DoubleType>) {
                print_floating(o, v, "double", "");
            } else if constexpr (std::is_same_v<T, NullType>) {
                o << "null";
            } else {
                print_reference(o, v);
            }
        },
        t._v);
    return o;
}

std::string DfType::to_string() const {
    std::ostringstream s;
    s << *this;
    return s.str();
}

std::ostream& operator<<(std::ostream& o, const Nullability n) {
    switch (n) {
    case Nullability::null: return o << "null";
    case Nullability::nullable: return o << "nullable";
    case Nullability::not_null: return o << "!null";
    case Nullability::unknown: return o << "unknown";
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const Mutability m) {
    switch (m) {
    case Mutability::modifiable: return o << "modifiable";
    case Mutability::unmodifiable: return o << "unmodifiable";
    case Mutability::unknown: return o << "unknown";
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const SpecialField f) {
    switch (f) {
    case SpecialField::array_length: return o << "length";
    case SpecialField::string_length: return o << "length()";
    case SpecialField::collection_size: return o << "size()";
    case SpecialField::unbox: return o << "value";
    case SpecialField::optional_value: return o << "get()";
    }
    return o;
}

template <constant_kind T>
std::optional<T> constant_of(const DfType& t) {
    if constexpr (std::is_same_v<T, bool>) {
        if (const auto b = t.get_if<BooleanType>()) {
            return b->value;
        }
    } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
        using Integral = std::conditional_t<std::is_same_v<T, int32_t>, IntType, LongType>;
        if (const auto i = t.get_if<Integral>()) {
            if (const auto n = i->range.constant_value()) {
                return n->template narrow<T>();
            }
            return {};
        }
    } else {
        if (const auto f = t.get_if<FloatingType<T>>()) {
            if (f->kind == FloatKind::constant) {
                return f->value;
            }
            return {};
        }
    }
    // Boxed constants carry the same value.
    if (const auto c = constant_object_of(t)) {
        if (const auto v = std::get_if<T>(&*c)) {
            return *v;
        }
    }
    return {};
}

template std::optional<bool> constant_of<bool>(const DfType&);
template std::optional<int32_t> constant_of<int32_t>(const DfType&);
template std::optional<int64_t> constant_of<int64_t>(const DfType&);
template std::optional<float> constant_of<float>(const DfType&);
template std::optional<double> constant_of<double>(const DfType&);

std::optional<ConstantObject> constant_object_of(const DfType& t) {
    if (const auto r = t.get_if<ReferenceType>()) {
        if (r->constant) {
            return r->constant->value;
        }
    }
    return {};
}

Nullability nullability_of(const DfType& t) {
    if (t.is<NullType>()) {
        return Nullability::null;
    }
    if (const auto r = t.get_if<ReferenceType>()) {
        return r->nullability;
    }
    return Nullability::unknown;
}

bool is_local(const DfType& t) {
    const auto r = t.get_if<ReferenceType>();
    return r != nullptr && r->local;
}

std::optional<RangeSet> range_of(const DfType& t) {
    if (const auto i = t.get_if<IntType>()) {
        return i->range;
    }
    if (const auto l = t.get_if<LongType>()) {
        return l->range;
    }
    return {};
}

} // namespace dftypes
