//! # AST Helpers
//!
//! Operator spelling, type cloning, and node construction helpers.

#include "ast/ast.hpp"

namespace spark::ast {

auto integer_width_bits(IntegerWidth width) -> uint32_t {
    switch (width) {
    case IntegerWidth::Eight:
        return 8;
    case IntegerWidth::Sixteen:
        return 16;
    case IntegerWidth::ThirtyTwo:
        return 32;
    case IntegerWidth::SixtyFour:
        return 64;
    }
    return 0;
}

auto op_to_string(Op op) -> std::string_view {
    switch (op) {
    case Op::Add:
        return "+";
    case Op::Sub:
        return "-";
    case Op::Star:
        return "*";
    case Op::Div:
        return "/";
    case Op::Mod:
        return "%";
    case Op::Eq:
        return "==";
    case Op::Greater:
        return ">";
    case Op::GreaterEq:
        return ">=";
    case Op::Less:
        return "<";
    case Op::LessEq:
        return "<=";
    case Op::ShLeft:
        return "<<";
    case Op::ShRight:
        return ">>";
    case Op::LogicalAnd:
        return "&&";
    case Op::LogicalOr:
        return "||";
    case Op::LogicalNot:
        return "!";
    case Op::AND:
        return "&";
    case Op::OR:
        return "|";
    case Op::XOR:
        return "^";
    case Op::NOT:
        return "~";
    case Op::Assign:
        return "=";
    }
    return "?";
}

auto operator<<(std::ostream& os, Op op) -> std::ostream& {
    return os << op_to_string(op);
}

// ============================================================================
// Type Cloning
// ============================================================================

static auto clone_box(const Box<Type>& ty) -> Box<Type> {
    return make_box<Type>(clone(*ty));
}

auto clone(const Type& ty) -> Type {
    return std::visit(
        [&ty](const auto& t) -> Type {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, PointerTypeExpr>) {
                return Type{ty.span, PointerTypeExpr{clone_box(t.pointee)}};
            } else if constexpr (std::is_same_v<T, ArrayTypeExpr>) {
                return Type{ty.span, ArrayTypeExpr{clone_box(t.element), t.len}};
            } else if constexpr (std::is_same_v<T, StructTypeExpr>) {
                StructTypeExpr out;
                for (const auto& field : t.fields) {
                    out.fields.push_back({clone_box(field.ty), field.name});
                }
                return Type{ty.span, std::move(out)};
            } else if constexpr (std::is_same_v<T, SumTypeExpr>) {
                SumTypeExpr out;
                for (const auto& variant : t.variants) {
                    out.variants.push_back(clone_box(variant));
                }
                return Type{ty.span, std::move(out)};
            } else if constexpr (std::is_same_v<T, FunTypeExpr>) {
                FunTypeExpr out;
                for (const auto& arg : t.args) {
                    out.args.push_back({clone_box(arg.ty), arg.name});
                }
                out.return_ty = clone_box(t.return_ty);
                return Type{ty.span, std::move(out)};
            } else {
                // Leaf annotations hold no children.
                return Type{ty.span, t};
            }
        },
        ty.kind);
}

// ============================================================================
// Construction Helpers
// ============================================================================

auto int_type(bool is_signed, IntegerWidth width, Span span) -> Type {
    return Type{span, IntegerTypeExpr{is_signed, width}};
}

auto float_type(bool doublewide, Span span) -> Type {
    return Type{span, FloatTypeExpr{doublewide}};
}

auto bool_type(Span span) -> Type {
    return Type{span, BoolTypeExpr{}};
}

auto unit_type(Span span) -> Type {
    return Type{span, UnitTypeExpr{}};
}

auto ptr_type(Type pointee, Span span) -> Type {
    return Type{span, PointerTypeExpr{make_box<Type>(std::move(pointee))}};
}

auto array_type(Type element, uint64_t len, Span span) -> Type {
    return Type{span, ArrayTypeExpr{make_box<Type>(std::move(element)), len}};
}

auto named_type(std::string name, Span span) -> Type {
    return Type{span, NamedTypeExpr{std::move(name)}};
}

auto int_lit(uint64_t value, Span span, std::optional<IntegerTypeExpr> suffix) -> Expr {
    return Expr{span, IntLiteral{value, suffix}};
}

auto float_lit(double value, Span span, bool doublewide) -> Expr {
    return Expr{span, FloatLiteral{value, doublewide}};
}

auto bool_lit(bool value, Span span) -> Expr {
    return Expr{span, BoolLiteral{value}};
}

auto access(std::string name, Span span) -> Expr {
    return Expr{span, AccessExpr{std::move(name)}};
}

auto binary(Expr lhs, Op op, Expr rhs) -> Expr {
    Span span = Span::merge(lhs.span, rhs.span);
    return Expr{span, BinaryExpr{make_box<Expr>(std::move(lhs)), op,
                                 make_box<Expr>(std::move(rhs))}};
}

auto unary(Op op, Expr operand, Span span) -> Expr {
    return Expr{span, UnaryExpr{op, make_box<Expr>(std::move(operand))}};
}

auto cast(Expr expr, Type target, Span span) -> Expr {
    return Expr{span, CastExpr{make_box<Expr>(std::move(expr)), std::move(target)}};
}

auto member(Expr base, std::string field, Span span) -> Expr {
    return Expr{span, MemberExpr{make_box<Expr>(std::move(base)), std::move(field)}};
}

auto call(Expr callee, std::vector<Expr> args, Span span) -> Expr {
    return Expr{span, CallExpr{make_box<Expr>(std::move(callee)), std::move(args)}};
}

} // namespace spark::ast
