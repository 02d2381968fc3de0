//! # Statement Lowering
//!
//! Builds the control-flow graph of a function body.
//!
//! ## Block Shapes
//!
//! ```text
//! if c {A} else {B}     bb: JmpIf(c, then, else)   then/else: ... Jmp(join)
//! while c {A}           bb: Jmp(head)   head: JmpIf(c, body, exit)   body: ... Jmp(head)
//! match v {T x => {A}}  bb: tmp = v; JmpMatch(tmp, [T -> arm], default)
//!                       arm: x = payload(tmp, T); ... Jmp(join)
//! ```
//!
//! A join block is created only when some branch falls through to it.

#include "ir/lower.hpp"

#include "log/log.hpp"

#include <sstream>

namespace spark::ir {

void IrLowerer::emit(BBId bb, IrStmt stmt) {
    ctx_.bb_mut(bb).stmts.push_back(std::move(stmt));
}

void IrLowerer::terminate(BBId bb, IrTerminator term) {
    IrBB& block = ctx_.bb_mut(bb);
    if (block.terminator) {
        internal_error("lower", "block " + std::to_string(bb.raw()) + " terminated twice");
    }
    block.terminator = std::move(term);
}

auto IrLowerer::assignable(TypeId expected, TypeId actual) const -> bool {
    return expected == actual || expected == IrContext::INVALID || actual == IrContext::INVALID;
}

static auto mismatch(const IrContext& ctx, FileId file, Span span, const std::string& what,
                     TypeId expected, TypeId found) -> diag::Diagnostic {
    std::ostringstream msg;
    msg << "Mismatched " << what << ": expected " << ctx.typename_of(expected) << ", found "
        << ctx.typename_of(found);
    std::ostringstream label;
    label << "expression of type " << ctx.typename_of(found);
    auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
    diag.with_label(diag::Label::primary(file, span, label.str()));
    return diag;
}

auto IrLowerer::lower_block(FileId file, FunId fun, const std::vector<ast::Stmt>& stmts,
                            BBId bb) -> std::optional<BBId> {
    push_scope();
    std::optional<BBId> current = bb;

    for (const auto& stmt : stmts) {
        if (limit_reached()) {
            break;
        }
        if (!current) {
            auto diag =
                diag::Diagnostic::warning(diag::ErrorCodes::UNREACHABLE_CODE, "Unreachable code");
            diag.with_label(diag::Label::primary(file, stmt.span, "this statement never runs"));
            report(std::move(diag));
            break;
        }

        auto result = lower_stmt(file, fun, stmt, *current);
        if (is_err(result)) {
            report(std::move(unwrap_err(result)));
            continue;
        }
        current = unwrap(result);
    }

    pop_scope();
    return current;
}

auto IrLowerer::lower_stmt(FileId file, FunId fun, const ast::Stmt& stmt, BBId bb)
    -> Result<std::optional<BBId>, diag::Diagnostic> {
    return std::visit(
        [&](const auto& s) -> Result<std::optional<BBId>, diag::Diagnostic> {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, ast::LetStmt>) {
                return lower_let(file, fun, stmt, s, bb);
            } else if constexpr (std::is_same_v<T, ast::AssignStmt>) {
                return lower_assign(file, fun, stmt, s, bb);
            } else if constexpr (std::is_same_v<T, ast::ReturnStmt>) {
                return lower_return(file, fun, stmt, s, bb);
            } else if constexpr (std::is_same_v<T, ast::IfStmt>) {
                return lower_if(file, fun, s, bb);
            } else if constexpr (std::is_same_v<T, ast::WhileStmt>) {
                return lower_while(file, fun, s, bb);
            } else if constexpr (std::is_same_v<T, ast::MatchStmt>) {
                return lower_match(file, fun, s, bb);
            } else if constexpr (std::is_same_v<T, ast::BlockStmt>) {
                return lower_block(file, fun, s.body, bb);
            } else if constexpr (std::is_same_v<T, ast::ExprStmt>) {
                auto value = lower_expr(file, fun, s.expr, bb);
                if (is_err(value)) {
                    return std::move(unwrap_err(value));
                }
                IrExpr expr = std::move(unwrap(value));
                VarId tmp = ctx_.insert_var(IrVar{expr.ty, "_"});
                emit(bb, IrStmt{IrVarLive{tmp}});
                emit(bb, IrStmt{IrStore{tmp, std::move(expr)}});
                return std::optional<BBId>(bb);
            }
        },
        stmt.kind);
}

// ============================================================================
// Bindings
// ============================================================================

auto IrLowerer::lower_let(FileId file, FunId fun, const ast::Stmt& stmt, const ast::LetStmt& let,
                          BBId bb) -> Result<std::optional<BBId>, diag::Diagnostic> {
    // On error the name is still bound, as INVALID, so later uses stay quiet.
    auto poison = [&](diag::Diagnostic diag) -> Result<std::optional<BBId>, diag::Diagnostic> {
        bind(let.name, ctx_.insert_var(IrVar{IrContext::INVALID, let.name}));
        return diag;
    };

    std::optional<TypeId> declared;
    if (let.ty) {
        auto ty_result = resolve_type(file, *let.ty);
        if (is_err(ty_result)) {
            return poison(std::move(unwrap_err(ty_result)));
        }
        declared = unwrap(ty_result);
    }

    std::optional<IrExpr> init;
    if (let.init) {
        auto init_result = lower_expr(file, fun, *let.init, bb);
        if (is_err(init_result)) {
            return poison(std::move(unwrap_err(init_result)));
        }
        init = std::move(unwrap(init_result));
    }

    if (!declared && !init) {
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::CANNOT_INFER,
                                            "Cannot infer the type of " + let.name);
        diag.with_label(diag::Label::primary(file, stmt.span))
            .with_help("add a type annotation or an initializer");
        return poison(std::move(diag));
    }

    if (declared && init && !assignable(*declared, init->ty)) {
        return poison(mismatch(ctx_, file, init->span, "initializer type", *declared, init->ty));
    }

    TypeId ty = declared ? *declared : init->ty;
    VarId var = ctx_.insert_var(IrVar{ty, let.name});
    emit(bb, IrStmt{IrVarLive{var}});
    if (init) {
        emit(bb, IrStmt{IrStore{var, std::move(*init)}});
    }
    bind(let.name, var);
    return std::optional<BBId>(bb);
}

auto IrLowerer::lower_assign(FileId file, FunId fun, const ast::Stmt& /*stmt*/,
                             const ast::AssignStmt& assign, BBId bb)
    -> Result<std::optional<BBId>, diag::Diagnostic> {
    auto var = lookup(assign.name);
    if (!var) {
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::UNDECLARED_IDENT,
                                            "Unknown identifier " + assign.name);
        diag.with_label(diag::Label::primary(file, assign.name_span, "not found in this scope"));
        return diag;
    }

    auto value = lower_expr(file, fun, assign.value, bb);
    if (is_err(value)) {
        return std::move(unwrap_err(value));
    }
    IrExpr expr = std::move(unwrap(value));

    TypeId var_ty = ctx_.var(*var).ty;
    if (!assignable(var_ty, expr.ty)) {
        auto diag = mismatch(ctx_, file, expr.span, "assignment type", var_ty, expr.ty);
        diag.with_label(diag::Label::secondary(file, assign.name_span,
                                               "variable " + assign.name + " assigned here"));
        return diag;
    }

    emit(bb, IrStmt{IrStore{*var, std::move(expr)}});
    return std::optional<BBId>(bb);
}

auto IrLowerer::lower_return(FileId file, FunId fun, const ast::Stmt& stmt,
                             const ast::ReturnStmt& ret, BBId bb)
    -> Result<std::optional<BBId>, diag::Diagnostic> {
    TypeId expected = ctx_.fun(fun).ty.return_ty;

    std::optional<IrExpr> value;
    if (ret.value) {
        auto result = lower_expr(file, fun, *ret.value, bb);
        if (is_err(result)) {
            return std::move(unwrap_err(result));
        }
        value = std::move(unwrap(result));
    } else {
        value = IrExpr{stmt.span, IrContext::UNIT, IrUnitLiteral{}};
    }

    if (!assignable(expected, value->ty)) {
        return mismatch(ctx_, file, value->span, "return type", expected, value->ty);
    }

    terminate(bb, IrTerminator{IrReturn{std::move(*value)}});
    return std::optional<BBId>{};
}

// ============================================================================
// Control Flow
// ============================================================================

/// Checks that a branch condition is a bool or a number. A number is taken
/// as true when non-zero.
static auto check_condition(const IrContext& ctx, FileId file, const IrExpr& cond,
                            const char* construct) -> std::optional<diag::Diagnostic> {
    if (cond.ty == IrContext::INVALID) {
        return std::nullopt;
    }
    const IrType& ty = ctx.type(cond.ty);
    if (ty.is<IrBoolType>() || ty.is<IrIntegerType>() || ty.is<IrFloatType>()) {
        return std::nullopt;
    }
    std::ostringstream msg;
    msg << construct << " condition must be a bool, integer or float, found "
        << ctx.typename_of(cond.ty);
    auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
    diag.with_label(diag::Label::primary(file, cond.span));
    return diag;
}

auto IrLowerer::lower_if(FileId file, FunId fun, const ast::IfStmt& if_stmt, BBId bb)
    -> Result<std::optional<BBId>, diag::Diagnostic> {
    auto cond_result = lower_expr(file, fun, if_stmt.condition, bb);
    if (is_err(cond_result)) {
        return std::move(unwrap_err(cond_result));
    }
    IrExpr cond = std::move(unwrap(cond_result));
    if (auto diag = check_condition(ctx_, file, cond, "If")) {
        return std::move(*diag);
    }

    BBId then_bb = ctx_.insert_bb();

    if (!if_stmt.else_body) {
        BBId join = ctx_.insert_bb();
        terminate(bb, IrTerminator{IrJmpIf{std::move(cond), then_bb, join}});
        if (auto then_end = lower_block(file, fun, if_stmt.then_body, then_bb)) {
            terminate(*then_end, IrTerminator{IrJmp{join}});
        }
        return std::optional<BBId>(join);
    }

    BBId else_bb = ctx_.insert_bb();
    terminate(bb, IrTerminator{IrJmpIf{std::move(cond), then_bb, else_bb}});
    auto then_end = lower_block(file, fun, if_stmt.then_body, then_bb);
    auto else_end = lower_block(file, fun, *if_stmt.else_body, else_bb);

    if (!then_end && !else_end) {
        return std::optional<BBId>{};
    }
    BBId join = ctx_.insert_bb();
    for (const auto& end : {then_end, else_end}) {
        if (end) {
            terminate(*end, IrTerminator{IrJmp{join}});
        }
    }
    return std::optional<BBId>(join);
}

auto IrLowerer::lower_while(FileId file, FunId fun, const ast::WhileStmt& while_stmt, BBId bb)
    -> Result<std::optional<BBId>, diag::Diagnostic> {
    auto cond_result = lower_expr(file, fun, while_stmt.condition, bb);
    if (is_err(cond_result)) {
        return std::move(unwrap_err(cond_result));
    }
    IrExpr cond = std::move(unwrap(cond_result));
    if (auto diag = check_condition(ctx_, file, cond, "While")) {
        return std::move(*diag);
    }

    BBId head = ctx_.insert_bb();
    BBId body = ctx_.insert_bb();
    BBId exit = ctx_.insert_bb();

    terminate(bb, IrTerminator{IrJmp{head}});
    terminate(head, IrTerminator{IrJmpIf{std::move(cond), body, exit}});
    if (auto body_end = lower_block(file, fun, while_stmt.body, body)) {
        terminate(*body_end, IrTerminator{IrJmp{head}});
    }
    return std::optional<BBId>(exit);
}

auto IrLowerer::lower_match(FileId file, FunId fun, const ast::MatchStmt& match, BBId bb)
    -> Result<std::optional<BBId>, diag::Diagnostic> {
    auto value_result = lower_expr(file, fun, match.value, bb);
    if (is_err(value_result)) {
        return std::move(unwrap_err(value_result));
    }
    IrExpr value = std::move(unwrap(value_result));
    TypeId sum_ty = value.ty;

    // The arms cannot be checked against a value that already failed.
    if (sum_ty == IrContext::INVALID) {
        return std::optional<BBId>(bb);
    }

    if (!ctx_.type(ctx_.unwrap_alias(sum_ty)).is<IrSumType>()) {
        std::ostringstream msg;
        msg << "Cannot match on expression of type " << ctx_.typename_of(sum_ty);
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
        diag.with_label(diag::Label::primary(file, value.span, "expected a sum type"));
        return diag;
    }

    // Resolve every arm before any block is built.
    std::vector<DiscriminantId> discs;
    for (const auto& arm : match.arms) {
        auto ty_result = resolve_type(file, arm.variant);
        if (is_err(ty_result)) {
            return std::move(unwrap_err(ty_result));
        }
        TypeId arm_ty = unwrap(ty_result);
        auto disc = ctx_.discriminant(sum_ty, arm_ty);
        if (!disc) {
            std::ostringstream msg;
            msg << "Type " << ctx_.typename_of(arm_ty) << " is not a variant of "
                << ctx_.typename_of(sum_ty);
            auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_MISMATCH, msg.str());
            diag.with_label(diag::Label::primary(file, arm.variant.span))
                .with_label(diag::Label::secondary(file, value.span, "matched value"));
            return diag;
        }
        for (size_t i = 0; i < discs.size(); ++i) {
            if (discs[i] == *disc) {
                std::ostringstream msg;
                msg << "Variant " << ctx_.typename_of(arm_ty) << " is matched more than once";
                auto diag = diag::Diagnostic::error(diag::ErrorCodes::DUPLICATE_DEF, msg.str());
                diag.with_label(diag::Label::primary(file, arm.span))
                    .with_label(diag::Label::secondary(file, match.arms[i].span,
                                                       "first matched here"));
                return diag;
            }
        }
        discs.push_back(*disc);
    }

    Span value_span = value.span;
    VarId scrutinee = ctx_.insert_var(IrVar{sum_ty, "match"});
    emit(bb, IrStmt{IrVarLive{scrutinee}});
    emit(bb, IrStmt{IrStore{scrutinee, std::move(value)}});

    std::optional<BBId> join;
    if (!match.default_body) {
        join = ctx_.insert_bb();
    }
    std::vector<BBId> ends;

    std::vector<std::pair<DiscriminantId, BBId>> targets;
    for (size_t i = 0; i < match.arms.size(); ++i) {
        const auto& arm = match.arms[i];
        BBId arm_bb = ctx_.insert_bb();
        targets.emplace_back(discs[i], arm_bb);

        push_scope();
        if (arm.binding) {
            TypeId payload_ty = ctx_.variant_type(sum_ty, discs[i]);
            VarId var = ctx_.insert_var(IrVar{payload_ty, *arm.binding});
            IrExpr source{value_span, sum_ty, IrVarRef{scrutinee}};
            emit(arm_bb, IrStmt{IrVarLive{var}});
            emit(arm_bb,
                 IrStmt{IrStore{var, IrExpr{arm.span, payload_ty,
                                            IrVariantPayload{make_box<IrExpr>(std::move(source)),
                                                             discs[i]}}}});
            bind(*arm.binding, var);
        }
        auto end = lower_block(file, fun, arm.body, arm_bb);
        pop_scope();
        if (end) {
            ends.push_back(*end);
        }
    }

    std::optional<BBId> default_bb;
    if (match.default_body) {
        default_bb = ctx_.insert_bb();
        if (auto end = lower_block(file, fun, *match.default_body, *default_bb)) {
            ends.push_back(*end);
        }
    }

    if (!ends.empty() && !join) {
        join = ctx_.insert_bb();
    }
    for (BBId end : ends) {
        terminate(end, IrTerminator{IrJmp{*join}});
    }

    IrExpr variant{value_span, sum_ty, IrVarRef{scrutinee}};
    terminate(bb, IrTerminator{IrJmpMatch{std::move(variant), std::move(targets),
                                          default_bb ? *default_bb : *join}});
    return join;
}

} // namespace spark::ir
