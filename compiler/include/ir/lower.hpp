//! # AST to IR Lowering
//!
//! `IrLowerer` type-checks a parsed module and builds its IR inside an
//! `IrContext`.
//!
//! ## Phases
//!
//! | Phase | Work                                                        |
//! |-------|-------------------------------------------------------------|
//! | 1     | Declare every type alias (nominal, body not yet known)      |
//! | 2     | Resolve and attach each alias's underlying type             |
//! | 3     | Declare every function signature                            |
//! | 4     | Lower function bodies into basic blocks                     |
//!
//! Declaring before defining lets types and functions refer to each other
//! in any order, including recursively.
//!
//! ## Errors
//!
//! User errors come back as `diag::Diagnostic` values; one failed statement
//! does not stop the rest of the function from being checked. Variables
//! whose initializer failed are bound with type `INVALID`, and operators on
//! `INVALID` operands stay silent, so one mistake yields one diagnostic.

#pragma once

#include "ast/ast.hpp"
#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "ir/ir.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spark::ir {

class IrLowerer {
public:
    explicit IrLowerer(IrContext& ctx);

    /// Lowers a whole module. On success returns the functions it declared,
    /// in source order; otherwise every diagnostic collected (errors and
    /// warnings).
    auto lower_module(const ast::Module& module)
        -> Result<std::vector<FunId>, std::vector<diag::Diagnostic>>;

    // ========================================================================
    // Types and Declarations
    // ========================================================================

    /// Interns the IR type an annotation denotes.
    auto resolve_type(FileId file, const ast::Type& ty) -> Result<TypeId, diag::Diagnostic>;

    /// Adds a function signature to the context without lowering its body.
    auto declare_fun(FileId file, const ast::FunDecl& decl) -> Result<FunId, diag::Diagnostic>;

    /// Lowers the body of a function declared with `declare_fun`. Diagnostics
    /// are collected, not returned.
    void lower_fun_body(FunId fun, const std::vector<ast::Stmt>& body);

    // ========================================================================
    // Expressions
    // ========================================================================

    auto lower_expr(FileId file, FunId fun, const ast::Expr& expr, BBId bb)
        -> Result<IrExpr, diag::Diagnostic>;

    /// Types `lhs op rhs` against the operator table.
    auto lower_bin(FileId file, FunId fun, const ast::Expr& lhs, ast::Op op,
                   const ast::Expr& rhs, BBId bb) -> Result<IrExpr, diag::Diagnostic>;

    /// Types `op expr`. The result keeps the operand's span.
    auto lower_unary(FileId file, FunId fun, ast::Op op, const ast::Expr& expr, BBId bb)
        -> Result<IrExpr, diag::Diagnostic>;

    // ========================================================================
    // Statements
    // ========================================================================

    /// Lowers one statement starting in `bb`. Returns the block where control
    /// continues, or `std::nullopt` if the statement terminated control flow.
    auto lower_stmt(FileId file, FunId fun, const ast::Stmt& stmt, BBId bb)
        -> Result<std::optional<BBId>, diag::Diagnostic>;

    /// Lowers a statement list in a fresh scope. Statement errors are
    /// collected and lowering moves on to the next statement.
    auto lower_block(FileId file, FunId fun, const std::vector<ast::Stmt>& stmts, BBId bb)
        -> std::optional<BBId>;

    // ========================================================================
    // Scopes and Diagnostics
    // ========================================================================

    void push_scope();
    void pop_scope();
    /// Binds `name` in the innermost scope, shadowing earlier bindings.
    void bind(const std::string& name, VarId var);
    [[nodiscard]] auto lookup(const std::string& name) const -> std::optional<VarId>;

    [[nodiscard]] auto diagnostics() const -> const std::vector<diag::Diagnostic>& {
        return diags_;
    }
    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }

private:
    IrContext& ctx_;
    std::vector<std::unordered_map<std::string, VarId>> scopes_;
    std::unordered_map<std::string, FunId> funs_by_name_;
    std::vector<diag::Diagnostic> diags_;
    size_t error_count_ = 0;

    void report(diag::Diagnostic diag);
    /// True once `CompilerOptions::max_errors` errors have been collected.
    [[nodiscard]] auto limit_reached() const -> bool;

    void lower_type_defs(const ast::Module& module);
    [[nodiscard]] auto is_cyclic_alias(TypeId alias) const -> bool;

    // Expression kinds
    auto lower_access(FileId file, const ast::Expr& expr, const ast::AccessExpr& access)
        -> Result<IrExpr, diag::Diagnostic>;
    auto lower_cast(FileId file, FunId fun, const ast::Expr& expr, const ast::CastExpr& cast,
                    BBId bb) -> Result<IrExpr, diag::Diagnostic>;
    auto lower_member(FileId file, FunId fun, const ast::Expr& expr,
                      const ast::MemberExpr& member, BBId bb)
        -> Result<IrExpr, diag::Diagnostic>;
    auto lower_call(FileId file, FunId fun, const ast::Expr& expr, const ast::CallExpr& call,
                    BBId bb) -> Result<IrExpr, diag::Diagnostic>;
    [[nodiscard]] auto cast_allowed(TypeId from, TypeId to) const -> bool;

    // Statement kinds
    auto lower_let(FileId file, FunId fun, const ast::Stmt& stmt, const ast::LetStmt& let,
                   BBId bb) -> Result<std::optional<BBId>, diag::Diagnostic>;
    auto lower_assign(FileId file, FunId fun, const ast::Stmt& stmt,
                      const ast::AssignStmt& assign, BBId bb)
        -> Result<std::optional<BBId>, diag::Diagnostic>;
    auto lower_return(FileId file, FunId fun, const ast::Stmt& stmt,
                      const ast::ReturnStmt& ret, BBId bb)
        -> Result<std::optional<BBId>, diag::Diagnostic>;
    auto lower_if(FileId file, FunId fun, const ast::IfStmt& if_stmt, BBId bb)
        -> Result<std::optional<BBId>, diag::Diagnostic>;
    auto lower_while(FileId file, FunId fun, const ast::WhileStmt& while_stmt, BBId bb)
        -> Result<std::optional<BBId>, diag::Diagnostic>;
    auto lower_match(FileId file, FunId fun, const ast::MatchStmt& match, BBId bb)
        -> Result<std::optional<BBId>, diag::Diagnostic>;

    void emit(BBId bb, IrStmt stmt);
    void terminate(BBId bb, IrTerminator term);
    /// Types that may flow into each other without a cast.
    [[nodiscard]] auto assignable(TypeId expected, TypeId actual) const -> bool;
    /// Names visible from the current scopes, for suggestions.
    [[nodiscard]] auto visible_names() const -> std::vector<std::string>;
};

} // namespace spark::ir
