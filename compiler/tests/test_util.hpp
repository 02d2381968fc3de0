//! # Test Utilities
//!
//! AST builders for the lowering, codegen and backend tests, and a fixture
//! holding an `IrContext` with one open function to lower into.

#pragma once

#include "ast/ast.hpp"
#include "ir/ir.hpp"
#include "ir/lower.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace spark::test {

inline auto sp(uint32_t from, uint32_t to) -> Span {
    return Span{from, to};
}

inline auto i32_type() -> ast::Type {
    return ast::int_type(true, ast::IntegerWidth::ThirtyTwo);
}

inline auto u8_type() -> ast::Type {
    return ast::int_type(false, ast::IntegerWidth::Eight);
}

inline auto i64_type() -> ast::Type {
    return ast::int_type(true, ast::IntegerWidth::SixtyFour);
}

inline auto unit_lit(Span span) -> ast::Expr {
    return ast::Expr{span, ast::UnitLiteral{}};
}

// ============================================================================
// Move-only sequences
// ============================================================================

template <typename... E> auto exprs(E&&... e) -> std::vector<ast::Expr> {
    std::vector<ast::Expr> out;
    (out.push_back(std::move(e)), ...);
    return out;
}

template <typename... S> auto stmts(S&&... s) -> std::vector<ast::Stmt> {
    std::vector<ast::Stmt> out;
    (out.push_back(std::move(s)), ...);
    return out;
}

// ============================================================================
// Type annotations
// ============================================================================

inline auto field(ast::Type ty, std::string name) -> ast::StructFieldExpr {
    return ast::StructFieldExpr{make_box<ast::Type>(std::move(ty)), std::move(name)};
}

template <typename... F> auto struct_type(F&&... fields) -> ast::Type {
    ast::StructTypeExpr st;
    (st.fields.push_back(std::move(fields)), ...);
    return ast::Type{Span{}, std::move(st)};
}

template <typename... T> auto sum_type(T&&... variants) -> ast::Type {
    ast::SumTypeExpr sum;
    (sum.variants.push_back(make_box<ast::Type>(std::move(variants))), ...);
    return ast::Type{Span{}, std::move(sum)};
}

// ============================================================================
// Statements
// ============================================================================

inline auto let_stmt(std::string name, std::optional<ast::Type> ty, std::optional<ast::Expr> init,
                     Span span = {}) -> ast::Stmt {
    return ast::Stmt{span, ast::LetStmt{std::move(name), std::move(ty), std::move(init)}};
}

inline auto assign_stmt(std::string name, ast::Expr value, Span name_span = {}) -> ast::Stmt {
    Span span = Span::merge(name_span, value.span);
    return ast::Stmt{span, ast::AssignStmt{std::move(name), name_span, std::move(value)}};
}

inline auto return_stmt(std::optional<ast::Expr> value, Span span = {}) -> ast::Stmt {
    return ast::Stmt{span, ast::ReturnStmt{std::move(value)}};
}

inline auto expr_stmt(ast::Expr expr) -> ast::Stmt {
    Span span = expr.span;
    return ast::Stmt{span, ast::ExprStmt{std::move(expr)}};
}

inline auto if_stmt(ast::Expr cond, std::vector<ast::Stmt> then_body,
                    std::optional<std::vector<ast::Stmt>> else_body = std::nullopt)
    -> ast::Stmt {
    Span span = cond.span;
    return ast::Stmt{span,
                     ast::IfStmt{std::move(cond), std::move(then_body), std::move(else_body)}};
}

inline auto while_stmt(ast::Expr cond, std::vector<ast::Stmt> body) -> ast::Stmt {
    Span span = cond.span;
    return ast::Stmt{span, ast::WhileStmt{std::move(cond), std::move(body)}};
}

inline auto arm(ast::Type variant, std::optional<std::string> binding,
                std::vector<ast::Stmt> body, Span span = {}) -> ast::MatchArm {
    return ast::MatchArm{std::move(variant), std::move(binding), std::move(body), span};
}

// ============================================================================
// Declarations
// ============================================================================

inline auto param(ast::Type ty, std::string name) -> ast::FunParam {
    return ast::FunParam{std::move(ty), std::move(name)};
}

template <typename... P>
auto fun_decl(std::string name, ast::Type return_ty, std::optional<std::vector<ast::Stmt>> body,
              P&&... params) -> ast::FunDecl {
    ast::FunDecl decl;
    decl.proto.name = std::move(name);
    decl.proto.return_ty = std::move(return_ty);
    (decl.proto.args.push_back(std::move(params)), ...);
    decl.body = std::move(body);
    return decl;
}

inline auto type_def(std::string name, ast::Type ty, Span span = {}) -> ast::TypeDef {
    return ast::TypeDef{std::move(name), std::move(ty), span};
}

// ============================================================================
// Fixture
// ============================================================================

/// An `IrContext` with one open function `test` (no arguments, returns unit)
/// whose entry block expressions and statements can be lowered into.
class LowerFixture : public ::testing::Test {
protected:
    ir::IrContext ctx;
    ir::IrLowerer lowerer{ctx};
    FileId file = 0;
    ir::FunId fun = ir::FunId::from_raw(0);
    ir::BBId entry = ir::BBId::from_raw(0);

    void SetUp() override {
        fun = ctx.insert_fun(ir::IrFun{"test", ir::IrFunType{{}, ir::IrContext::UNIT}, file,
                                       Span{0, 100}, std::nullopt, ast::FunFlags::None});
        entry = ctx.insert_bb();
        ctx.fun_mut(fun).body = ir::IrBody{entry, fun};
        lowerer.push_scope();
    }

    /// Binds a fresh variable of type `ty` in the current scope.
    auto local(const std::string& name, ir::TypeId ty) -> ir::VarId {
        ir::VarId var = ctx.insert_var(ir::IrVar{ty, name});
        lowerer.bind(name, var);
        return var;
    }

    auto ptr(ir::TypeId pointee) -> ir::TypeId {
        return ctx.insert_type(ir::IrType{ir::IrPtrType{pointee}});
    }

    auto lower(const ast::Expr& expr) -> Result<ir::IrExpr, diag::Diagnostic> {
        return lowerer.lower_expr(file, fun, expr, entry);
    }
};

} // namespace spark::test
