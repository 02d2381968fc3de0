//! # Operator Typing
//!
//! ## Binary operators
//!
//! | LHS     | Operators                                       | RHS          | Result  |
//! |---------|-------------------------------------------------|--------------|---------|
//! | bool    | `&&` `||` `!` `==`                              | bool         | bool    |
//! | integer | `==` `>` `>=` `<` `<=` `*` `/` `+` `-` `<<` `>>`| same integer | LHS     |
//! | float   | `==` `>` `>=` `<` `<=` `*` `/` `+` `-`          | same float   | LHS     |
//! | pointer | `<<` `>>`                                       | integer      | LHS     |
//! | pointer | `+` `-`                                         | ptr/integer  | LHS     |
//! | pointer | `==`                                            | pointer      | bool    |
//!
//! ## Unary operators
//!
//! | Operator | Operand        | Result    |
//! |----------|----------------|-----------|
//! | `*`      | `*T`           | `T`       |
//! | `&`      | any `T`        | `*T`      |
//! | `-`      | integer, float | same      |
//! | `~`      | integer, ptr   | same      |
//!
//! Operand types are used exactly as interned; aliases are not looked through
//! and integer or float operands of different widths are rejected.

#include "ir/lower.hpp"

#include "log/log.hpp"

#include <sstream>

namespace spark::ir {

using ast::Op;

static auto is_one_of(Op op, std::initializer_list<Op> ops) -> bool {
    for (Op candidate : ops) {
        if (candidate == op) {
            return true;
        }
    }
    return false;
}

/// Result type of `lhs op rhs`, or nothing if the table rejects it.
static auto binary_result(const IrContext& ctx, TypeId lhs, Op op, TypeId rhs)
    -> std::optional<TypeId> {
    const IrType& lt = ctx.type(lhs);
    const IrType& rt = ctx.type(rhs);

    if (lt.is<IrBoolType>() && rt.is<IrBoolType>()) {
        if (is_one_of(op, {Op::LogicalAnd, Op::LogicalOr, Op::LogicalNot, Op::Eq})) {
            return IrContext::BOOL;
        }
        return std::nullopt;
    }

    // Integer and float operands must have the same type; nothing is widened.
    if (lt.is<IrIntegerType>() && rt.is<IrIntegerType>()) {
        if (lhs != rhs) {
            return std::nullopt;
        }
        if (is_one_of(op, {Op::Eq, Op::Greater, Op::GreaterEq, Op::Less, Op::LessEq, Op::Star,
                           Op::Div, Op::Add, Op::Sub, Op::ShLeft, Op::ShRight})) {
            return lhs;
        }
        return std::nullopt;
    }

    if (lt.is<IrFloatType>() && rt.is<IrFloatType>()) {
        if (lhs != rhs) {
            return std::nullopt;
        }
        if (is_one_of(op, {Op::Eq, Op::Greater, Op::GreaterEq, Op::Less, Op::LessEq, Op::Star,
                           Op::Div, Op::Add, Op::Sub})) {
            return lhs;
        }
        return std::nullopt;
    }

    if (lt.is<IrPtrType>()) {
        if (rt.is<IrIntegerType>() && is_one_of(op, {Op::ShLeft, Op::ShRight})) {
            return lhs;
        }
        if ((rt.is<IrPtrType>() || rt.is<IrIntegerType>()) && is_one_of(op, {Op::Add, Op::Sub})) {
            return lhs;
        }
        if (rt.is<IrPtrType>() && op == Op::Eq) {
            return IrContext::BOOL;
        }
    }

    return std::nullopt;
}

auto IrLowerer::lower_bin(FileId file, FunId fun, const ast::Expr& lhs, Op op,
                          const ast::Expr& rhs, BBId bb) -> Result<IrExpr, diag::Diagnostic> {
    auto lhs_result = lower_expr(file, fun, lhs, bb);
    if (is_err(lhs_result)) {
        return std::move(unwrap_err(lhs_result));
    }
    auto rhs_result = lower_expr(file, fun, rhs, bb);
    if (is_err(rhs_result)) {
        return std::move(unwrap_err(rhs_result));
    }

    IrExpr lhs_ir = std::move(unwrap(lhs_result));
    IrExpr rhs_ir = std::move(unwrap(rhs_result));
    Span span = Span::merge(lhs_ir.span, rhs_ir.span);

    // An operand already failed to type; its error has been reported.
    if (lhs_ir.ty == IrContext::INVALID || rhs_ir.ty == IrContext::INVALID) {
        return IrExpr{span, IrContext::INVALID,
                      IrBinary{make_box<IrExpr>(std::move(lhs_ir)), op,
                               make_box<IrExpr>(std::move(rhs_ir))}};
    }

    auto result_ty = binary_result(ctx_, lhs_ir.ty, op, rhs_ir.ty);
    if (!result_ty) {
        std::ostringstream msg;
        msg << "Cannot apply binary operator " << op << " to operand types "
            << ctx_.typename_of(lhs_ir.ty) << " and " << ctx_.typename_of(rhs_ir.ty);

        std::ostringstream lhs_msg;
        lhs_msg << "LHS of type " << ctx_.typename_of(lhs_ir.ty) << " appears here";
        std::ostringstream rhs_msg;
        rhs_msg << "RHS of type " << ctx_.typename_of(rhs_ir.ty) << " appears here";

        SPARK_LOG_DEBUG("lower", msg.str());
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
        diag.with_label(diag::Label::primary(file, span))
            .with_label(diag::Label::secondary(file, lhs_ir.span, lhs_msg.str()))
            .with_label(diag::Label::secondary(file, rhs_ir.span, rhs_msg.str()));
        return diag;
    }

    return IrExpr{span, *result_ty,
                  IrBinary{make_box<IrExpr>(std::move(lhs_ir)), op,
                           make_box<IrExpr>(std::move(rhs_ir))}};
}

auto IrLowerer::lower_unary(FileId file, FunId fun, Op op, const ast::Expr& expr, BBId bb)
    -> Result<IrExpr, diag::Diagnostic> {
    auto operand_result = lower_expr(file, fun, expr, bb);
    if (is_err(operand_result)) {
        return std::move(unwrap_err(operand_result));
    }

    IrExpr operand = std::move(unwrap(operand_result));
    Span span = operand.span;
    TypeId operand_ty = operand.ty;

    if (operand_ty == IrContext::INVALID) {
        return IrExpr{span, IrContext::INVALID, IrUnary{op, make_box<IrExpr>(std::move(operand))}};
    }

    const IrType& ty = ctx_.type(operand_ty);
    std::optional<TypeId> result_ty;

    switch (op) {
    case Op::Star:
        if (const auto* ptr = ty.get_if<IrPtrType>()) {
            result_ty = ptr->pointee;
        }
        break;
    case Op::AND:
        result_ty = ctx_.insert_type(IrType{IrPtrType{operand_ty}});
        break;
    case Op::Sub:
        if (ty.is<IrIntegerType>() || ty.is<IrFloatType>()) {
            result_ty = operand_ty;
        }
        break;
    case Op::NOT:
        if (ty.is<IrIntegerType>() || ty.is<IrPtrType>()) {
            result_ty = operand_ty;
        }
        break;
    default:
        break;
    }

    if (!result_ty) {
        std::ostringstream msg;
        msg << "Cannot apply unary operator " << op << " to expression of type "
            << ctx_.typename_of(operand_ty);

        SPARK_LOG_DEBUG("lower", msg.str());
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
        diag.with_label(diag::Label::primary(file, span));
        return diag;
    }

    return IrExpr{span, *result_ty, IrUnary{op, make_box<IrExpr>(std::move(operand))}};
}

} // namespace spark::ir
