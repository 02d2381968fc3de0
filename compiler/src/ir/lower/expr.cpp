//! # Expression Lowering
//!
//! Literals, name access, casts, member access and calls. Operators live in
//! `op.cpp`.

#include "ir/lower.hpp"

#include "log/log.hpp"

#include <sstream>

namespace spark::ir {

auto IrLowerer::lower_expr(FileId file, FunId fun, const ast::Expr& expr, BBId bb)
    -> Result<IrExpr, diag::Diagnostic> {
    return std::visit(
        [&](const auto& e) -> Result<IrExpr, diag::Diagnostic> {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ast::IntLiteral>) {
                TypeId ty = IrContext::I32;
                if (e.suffix) {
                    ty = IrContext::itype(e.suffix->is_signed,
                                          ast::integer_width_bits(e.suffix->width));
                }
                return IrExpr{expr.span, ty, IrIntLiteral{e.value}};
            } else if constexpr (std::is_same_v<T, ast::FloatLiteral>) {
                return IrExpr{expr.span, e.doublewide ? IrContext::F64 : IrContext::F32,
                              IrFloatLiteral{e.value}};
            } else if constexpr (std::is_same_v<T, ast::BoolLiteral>) {
                return IrExpr{expr.span, IrContext::BOOL, IrBoolLiteral{e.value}};
            } else if constexpr (std::is_same_v<T, ast::UnitLiteral>) {
                return IrExpr{expr.span, IrContext::UNIT, IrUnitLiteral{}};
            } else if constexpr (std::is_same_v<T, ast::AccessExpr>) {
                return lower_access(file, expr, e);
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                return lower_bin(file, fun, *e.lhs, e.op, *e.rhs, bb);
            } else if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                return lower_unary(file, fun, e.op, *e.operand, bb);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                return lower_cast(file, fun, expr, e, bb);
            } else if constexpr (std::is_same_v<T, ast::MemberExpr>) {
                return lower_member(file, fun, expr, e, bb);
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                return lower_call(file, fun, expr, e, bb);
            }
        },
        expr.kind);
}

auto IrLowerer::lower_access(FileId file, const ast::Expr& expr, const ast::AccessExpr& access)
    -> Result<IrExpr, diag::Diagnostic> {
    if (auto var = lookup(access.name)) {
        return IrExpr{expr.span, ctx_.var(*var).ty, IrVarRef{*var}};
    }

    auto fun_it = funs_by_name_.find(access.name);
    if (fun_it != funs_by_name_.end()) {
        return IrExpr{expr.span, ctx_.fun_type(fun_it->second), IrFunRef{fun_it->second}};
    }

    auto diag = diag::Diagnostic::error(diag::ErrorCodes::UNDECLARED_IDENT,
                                        "Unknown identifier " + access.name);
    diag.with_label(diag::Label::primary(file, expr.span, "not found in this scope"));
    std::string similar = diag::find_similar(access.name, visible_names());
    if (!similar.empty()) {
        diag.with_help("a binding with a similar name exists: " + similar);
    }
    return diag;
}

// ============================================================================
// Casts
// ============================================================================

auto IrLowerer::cast_allowed(TypeId from, TypeId to) const -> bool {
    if (from == to) {
        return true;
    }

    TypeId uf = ctx_.unwrap_alias(from);
    TypeId ut = ctx_.unwrap_alias(to);
    if (uf == ut) {
        return true;
    }

    const IrType& f = ctx_.type(uf);
    const IrType& t = ctx_.type(ut);

    bool f_int = f.is<IrIntegerType>();
    bool t_int = t.is<IrIntegerType>();
    bool f_float = f.is<IrFloatType>();
    bool t_float = t.is<IrFloatType>();
    bool f_ptr = f.is<IrPtrType>();
    bool t_ptr = t.is<IrPtrType>();

    if ((f_int || f_float) && (t_int || t_float)) {
        return true;
    }
    if (f.is<IrBoolType>() && t_int) {
        return true;
    }
    return (f_ptr && (t_ptr || t_int)) || (f_int && t_ptr);
}

auto IrLowerer::lower_cast(FileId file, FunId fun, const ast::Expr& expr,
                           const ast::CastExpr& cast, BBId bb)
    -> Result<IrExpr, diag::Diagnostic> {
    auto inner_result = lower_expr(file, fun, *cast.expr, bb);
    if (is_err(inner_result)) {
        return std::move(unwrap_err(inner_result));
    }
    auto target_result = resolve_type(file, cast.target);
    if (is_err(target_result)) {
        return std::move(unwrap_err(target_result));
    }

    IrExpr inner = std::move(unwrap(inner_result));
    TypeId target = unwrap(target_result);

    if (inner.ty == IrContext::INVALID) {
        return IrExpr{expr.span, IrContext::INVALID, IrCast{make_box<IrExpr>(std::move(inner))}};
    }

    // A variant converts into any sum that lists it.
    if (auto disc = ctx_.discriminant(target, inner.ty)) {
        return IrExpr{expr.span, target, IrMakeVariant{*disc, make_box<IrExpr>(std::move(inner))}};
    }

    if (!cast_allowed(inner.ty, target)) {
        std::ostringstream msg;
        msg << "Cannot cast expression of type " << ctx_.typename_of(inner.ty) << " to "
            << ctx_.typename_of(target);
        std::ostringstream operand_msg;
        operand_msg << "expression of type " << ctx_.typename_of(inner.ty);

        auto diag = diag::Diagnostic::error(diag::ErrorCodes::INVALID_CAST, msg.str());
        diag.with_label(diag::Label::primary(file, expr.span))
            .with_label(diag::Label::secondary(file, inner.span, operand_msg.str()));
        return diag;
    }

    return IrExpr{expr.span, target, IrCast{make_box<IrExpr>(std::move(inner))}};
}

// ============================================================================
// Member Access
// ============================================================================

auto IrLowerer::lower_member(FileId file, FunId fun, const ast::Expr& expr,
                             const ast::MemberExpr& member, BBId bb)
    -> Result<IrExpr, diag::Diagnostic> {
    auto base_result = lower_expr(file, fun, *member.base, bb);
    if (is_err(base_result)) {
        return std::move(unwrap_err(base_result));
    }
    IrExpr base = std::move(unwrap(base_result));
    TypeId base_ty = ctx_.unwrap_alias(base.ty);

    if (base.ty == IrContext::INVALID) {
        return IrExpr{expr.span, IrContext::INVALID,
                      IrMember{make_box<IrExpr>(std::move(base)), 0}};
    }

    const auto* st = ctx_.type(base_ty).get_if<IrStructType>();
    if (!st) {
        std::ostringstream msg;
        msg << "Cannot access field " << member.field << " on expression of type "
            << ctx_.typename_of(base.ty);
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
        diag.with_label(diag::Label::primary(file, expr.span))
            .with_label(diag::Label::secondary(file, base.span, "not a struct"));
        return diag;
    }

    auto index = st->field_index(member.field);
    if (!index) {
        std::ostringstream msg;
        msg << "No field named " << member.field << " in type " << ctx_.typename_of(base.ty);
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::FIELD_UNKNOWN, msg.str());
        diag.with_label(diag::Label::primary(file, expr.span, "unknown field"));

        std::vector<std::string> names;
        for (const auto& field : st->fields) {
            names.push_back(field.name);
        }
        std::string similar = diag::find_similar(member.field, names);
        if (!similar.empty()) {
            diag.with_help("a field with a similar name exists: " + similar);
        }
        return diag;
    }

    TypeId field_ty = st->fields[*index].ty;
    return IrExpr{expr.span, field_ty, IrMember{make_box<IrExpr>(std::move(base)), *index}};
}

// ============================================================================
// Calls
// ============================================================================

auto IrLowerer::lower_call(FileId file, FunId fun, const ast::Expr& expr,
                           const ast::CallExpr& call, BBId bb)
    -> Result<IrExpr, diag::Diagnostic> {
    auto callee_result = lower_expr(file, fun, *call.callee, bb);
    if (is_err(callee_result)) {
        return std::move(unwrap_err(callee_result));
    }
    IrExpr callee = std::move(unwrap(callee_result));

    std::vector<IrExpr> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        auto arg_result = lower_expr(file, fun, arg, bb);
        if (is_err(arg_result)) {
            return std::move(unwrap_err(arg_result));
        }
        args.push_back(std::move(unwrap(arg_result)));
    }

    if (callee.ty == IrContext::INVALID) {
        return IrExpr{expr.span, IrContext::INVALID,
                      IrCall{make_box<IrExpr>(std::move(callee)), std::move(args)}};
    }

    const auto* fun_ty = ctx_.type(ctx_.unwrap_alias(callee.ty)).get_if<IrFunType>();
    if (!fun_ty) {
        std::ostringstream msg;
        msg << "Expression of type " << ctx_.typename_of(callee.ty) << " is not callable";
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::NOT_CALLABLE, msg.str());
        diag.with_label(diag::Label::primary(file, callee.span));
        return diag;
    }

    if (fun_ty->args.size() != args.size()) {
        std::ostringstream msg;
        msg << "Function of type " << ctx_.typename_of(callee.ty) << " takes "
            << fun_ty->args.size() << " argument(s) but " << args.size() << " were supplied";
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::ARG_COUNT_MISMATCH, msg.str());
        diag.with_label(diag::Label::primary(file, expr.span));
        return diag;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        if (!assignable(fun_ty->args[i].ty, args[i].ty)) {
            std::ostringstream msg;
            msg << "Mismatched argument type: expected " << ctx_.typename_of(fun_ty->args[i].ty)
                << ", found " << ctx_.typename_of(args[i].ty);
            std::ostringstream arg_msg;
            arg_msg << "Argument of type " << ctx_.typename_of(args[i].ty) << " appears here";
            auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
            diag.with_label(diag::Label::primary(file, expr.span))
                .with_label(diag::Label::secondary(file, args[i].span, arg_msg.str()));
            return diag;
        }
    }

    TypeId return_ty = fun_ty->return_ty;
    return IrExpr{expr.span, return_ty,
                  IrCall{make_box<IrExpr>(std::move(callee)), std::move(args)}};
}

} // namespace spark::ir
