//! # IR Verifier

#include "ir/verify.hpp"

#include <deque>
#include <unordered_set>

namespace spark::ir {

/// Successor blocks of a terminator, in branch order.
static auto successors(const IrTerminator& term) -> std::vector<BBId> {
    return std::visit(
        [](const auto& t) -> std::vector<BBId> {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, IrReturn>) {
                return {};
            } else if constexpr (std::is_same_v<T, IrJmp>) {
                return {t.target};
            } else if constexpr (std::is_same_v<T, IrJmpIf>) {
                return {t.if_true, t.if_false};
            } else if constexpr (std::is_same_v<T, IrJmpMatch>) {
                std::vector<BBId> out;
                for (const auto& [disc, target] : t.discriminants) {
                    out.push_back(target);
                }
                out.push_back(t.default_jmp);
                return out;
            }
        },
        term.kind);
}

auto reachable_blocks(const IrContext& ctx, FunId fun) -> std::vector<BBId> {
    const IrFun& f = ctx.fun(fun);
    if (!f.body) {
        return {};
    }

    std::vector<BBId> order;
    std::unordered_set<BBId> seen;
    std::deque<BBId> queue{f.body->entry};
    seen.insert(f.body->entry);

    while (!queue.empty()) {
        BBId bb = queue.front();
        queue.pop_front();
        order.push_back(bb);

        if (!ctx.contains(bb)) {
            continue;
        }
        const auto& term = ctx.bb(bb).terminator;
        if (!term) {
            continue;
        }
        for (BBId next : successors(*term)) {
            if (seen.insert(next).second) {
                queue.push_back(next);
            }
        }
    }
    return order;
}

namespace {

class Verifier {
public:
    Verifier(const IrContext& ctx, FunId fun) : ctx_(ctx), fun_(fun) {}

    void run() {
        const IrFun& f = ctx_.fun(fun_);
        check_type(f.ty.return_ty);
        for (const auto& arg : f.ty.args) {
            check_type(arg.ty);
        }
        if (!f.body) {
            return;
        }
        if (f.body->parent != fun_) {
            fail("body parent does not match");
        }

        for (BBId bb : reachable_blocks(ctx_, fun_)) {
            if (!ctx_.contains(bb)) {
                fail("jumps to unknown block bb" + std::to_string(bb.raw()));
            }
            const IrBB& block = ctx_.bb(bb);
            for (const auto& stmt : block.stmts) {
                check_stmt(stmt);
            }
            if (!block.terminator) {
                fail("reachable block bb" + std::to_string(bb.raw()) + " has no terminator");
            }
            check_terminator(*block.terminator);
        }
    }

private:
    const IrContext& ctx_;
    FunId fun_;

    [[noreturn]] void fail(const std::string& msg) const {
        internal_error("ir", "verify " + ctx_.fun(fun_).name + ": " + msg);
    }

    void check_type(TypeId ty) const {
        if (!ctx_.contains(ty)) {
            fail("unknown type handle " + std::to_string(ty.raw()));
        }
    }

    void check_var(VarId var) const {
        if (!ctx_.contains(var)) {
            fail("unknown variable handle " + std::to_string(var.raw()));
        }
    }

    void check_stmt(const IrStmt& stmt) const {
        if (const auto* live = std::get_if<IrVarLive>(&stmt.kind)) {
            check_var(live->var);
        } else {
            const auto& store = std::get<IrStore>(stmt.kind);
            check_var(store.var);
            check_expr(store.value);
        }
    }

    void check_terminator(const IrTerminator& term) const {
        std::visit(
            [this](const auto& t) {
                using T = std::decay_t<decltype(t)>;

                if constexpr (std::is_same_v<T, IrReturn>) {
                    check_expr(t.value);
                } else if constexpr (std::is_same_v<T, IrJmpIf>) {
                    check_expr(t.condition);
                } else if constexpr (std::is_same_v<T, IrJmpMatch>) {
                    check_expr(t.variant);
                    for (const auto& [disc, target] : t.discriminants) {
                        (void)ctx_.variant_type(t.variant.ty, disc);
                    }
                }
            },
            term.kind);
    }

    void check_expr(const IrExpr& expr) const {
        check_type(expr.ty);
        std::visit(
            [this](const auto& e) {
                using T = std::decay_t<decltype(e)>;

                if constexpr (std::is_same_v<T, IrVarRef>) {
                    check_var(e.var);
                } else if constexpr (std::is_same_v<T, IrFunRef>) {
                    if (!ctx_.contains(e.fun)) {
                        fail("unknown function handle " + std::to_string(e.fun.raw()));
                    }
                } else if constexpr (std::is_same_v<T, IrArgRef>) {
                    if (e.index >= ctx_.fun(fun_).ty.args.size()) {
                        fail("argument index " + std::to_string(e.index) + " out of range");
                    }
                } else if constexpr (std::is_same_v<T, IrBinary>) {
                    check_expr(*e.lhs);
                    check_expr(*e.rhs);
                } else if constexpr (std::is_same_v<T, IrUnary>) {
                    check_expr(*e.operand);
                } else if constexpr (std::is_same_v<T, IrCast>) {
                    check_expr(*e.expr);
                } else if constexpr (std::is_same_v<T, IrMember>) {
                    check_expr(*e.base);
                } else if constexpr (std::is_same_v<T, IrCall>) {
                    check_expr(*e.callee);
                    for (const auto& arg : e.args) {
                        check_expr(arg);
                    }
                } else if constexpr (std::is_same_v<T, IrMakeVariant>) {
                    check_expr(*e.value);
                } else if constexpr (std::is_same_v<T, IrVariantPayload>) {
                    check_expr(*e.sum);
                }
            },
            expr.kind);
    }
};

} // namespace

void verify_fun(const IrContext& ctx, FunId fun) {
    Verifier(ctx, fun).run();
}

} // namespace spark::ir
