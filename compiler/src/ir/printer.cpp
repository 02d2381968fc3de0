//! # IR Pretty Printer
//!
//! Only blocks reachable from a function's entry are printed, in
//! breadth-first order. Declared functions print as a one-line `extern fun`.

#include "ir/printer.hpp"

#include "ir/verify.hpp"

#include <sstream>

namespace spark::ir {

auto IrPrinter::print_context() -> std::string {
    std::ostringstream out;
    for (FunId fun : ctx_.fun_ids()) {
        out << print_fun(fun) << "\n";
    }
    return out.str();
}

auto IrPrinter::print_fun(FunId fun) -> std::string {
    std::ostringstream out;
    const IrFun& f = ctx_.fun(fun);

    if (!f.body) {
        out << "extern ";
    }
    out << "fun " << f.name << "(";
    for (size_t i = 0; i < f.ty.args.size(); ++i) {
        if (i > 0)
            out << ", ";
        out << ctx_.typename_of(f.ty.args[i].ty);
        if (f.ty.args[i].name) {
            out << " " << *f.ty.args[i].name;
        }
    }
    out << ") -> " << ctx_.typename_of(f.ty.return_ty);

    if (!f.body) {
        out << "\n";
        return out.str();
    }

    out << " {\n";
    for (BBId bb : reachable_blocks(ctx_, fun)) {
        out << print_block(bb);
    }
    out << "}\n";
    return out.str();
}

auto IrPrinter::print_block(BBId bb) -> std::string {
    std::ostringstream out;
    const IrBB& block = ctx_.bb(bb);

    out << "bb" << bb.raw() << ":\n";
    for (const auto& stmt : block.stmts) {
        out << "    " << print_stmt(stmt) << "\n";
    }
    if (block.terminator) {
        out << "    " << print_terminator(*block.terminator) << "\n";
    } else {
        out << "    ; no terminator\n";
    }
    return out.str();
}

auto IrPrinter::print_stmt(const IrStmt& stmt) -> std::string {
    std::ostringstream out;
    if (const auto* live = std::get_if<IrVarLive>(&stmt.kind)) {
        const IrVar& var = ctx_.var(live->var);
        out << "live %" << live->var.raw() << " " << var.name << ": " << ctx_.typename_of(var.ty);
    } else {
        const auto& store = std::get<IrStore>(stmt.kind);
        out << "%" << store.var.raw() << " = " << print_expr(store.value);
    }
    return out.str();
}

auto IrPrinter::print_terminator(const IrTerminator& term) -> std::string {
    std::ostringstream out;

    std::visit(
        [&out, this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, IrReturn>) {
                out << "return " << print_expr(t.value);
            } else if constexpr (std::is_same_v<T, IrJmp>) {
                out << "jmp bb" << t.target.raw();
            } else if constexpr (std::is_same_v<T, IrJmpIf>) {
                out << "jmpif " << print_expr(t.condition) << ", bb" << t.if_true.raw() << ", bb"
                    << t.if_false.raw();
            } else if constexpr (std::is_same_v<T, IrJmpMatch>) {
                out << "match " << print_expr(t.variant) << " [";
                for (size_t i = 0; i < t.discriminants.size(); ++i) {
                    if (i > 0)
                        out << ", ";
                    const auto& [disc, target] = t.discriminants[i];
                    out << ctx_.typename_of(ctx_.variant_type(t.variant.ty, disc)) << " -> bb"
                        << target.raw();
                }
                out << "], default bb" << t.default_jmp.raw();
            }
        },
        term.kind);

    return out.str();
}

auto IrPrinter::print_expr(const IrExpr& expr) -> std::string {
    std::ostringstream out;

    std::visit(
        [&out, &expr, this](const auto& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, IrIntLiteral>) {
                out << e.value;
            } else if constexpr (std::is_same_v<T, IrFloatLiteral>) {
                out << e.value;
            } else if constexpr (std::is_same_v<T, IrBoolLiteral>) {
                out << (e.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, IrUnitLiteral>) {
                out << "()";
            } else if constexpr (std::is_same_v<T, IrVarRef>) {
                out << "%" << e.var.raw();
            } else if constexpr (std::is_same_v<T, IrArgRef>) {
                out << "arg" << e.index;
            } else if constexpr (std::is_same_v<T, IrFunRef>) {
                out << "@" << ctx_.fun(e.fun).name;
            } else if constexpr (std::is_same_v<T, IrBinary>) {
                out << "(" << print_expr(*e.lhs) << " " << e.op << " " << print_expr(*e.rhs)
                    << ")";
            } else if constexpr (std::is_same_v<T, IrUnary>) {
                out << "(" << e.op << print_expr(*e.operand) << ")";
            } else if constexpr (std::is_same_v<T, IrCast>) {
                out << "(" << print_expr(*e.expr) << " as " << ctx_.typename_of(expr.ty) << ")";
            } else if constexpr (std::is_same_v<T, IrMember>) {
                out << print_expr(*e.base) << "." << e.field;
            } else if constexpr (std::is_same_v<T, IrCall>) {
                out << print_expr(*e.callee) << "(";
                for (size_t i = 0; i < e.args.size(); ++i) {
                    if (i > 0)
                        out << ", ";
                    out << print_expr(e.args[i]);
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, IrMakeVariant>) {
                out << "variant" << e.disc.raw() << "(" << print_expr(*e.value) << ")";
            } else if constexpr (std::is_same_v<T, IrVariantPayload>) {
                out << "payload" << e.disc.raw() << "(" << print_expr(*e.sum) << ")";
            }
        },
        expr.kind);

    return out.str();
}

} // namespace spark::ir
