//! # IR Codegen Terminators
//!
//! `match` lowers to a `switch` on the sum's tag field. A numeric branch
//! condition is compared against zero first.

#include "codegen/ir_codegen.hpp"

namespace spark::codegen {

void IrCodegen::emit_terminator(const ir::IrTerminator& term) {
    std::visit(
        [this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ir::IrReturn>) {
                std::string value = emit_expr(t.value);
                emitln("    ret " + llvm_type(t.value.ty) + " " + value);
            } else if constexpr (std::is_same_v<T, ir::IrJmp>) {
                emitln("    br label %" + block_label(t.target));
            } else if constexpr (std::is_same_v<T, ir::IrJmpIf>) {
                std::string cond = emit_expr(t.condition);
                const ir::IrType& cond_ty = ctx_.type(t.condition.ty);
                if (!cond_ty.is<ir::IrBoolType>()) {
                    std::string ty = llvm_type(t.condition.ty);
                    std::string nonzero = new_temp();
                    if (cond_ty.is<ir::IrFloatType>()) {
                        emitln("    " + nonzero + " = fcmp une " + ty + " " + cond + ", 0.0");
                    } else {
                        emitln("    " + nonzero + " = icmp ne " + ty + " " + cond + ", 0");
                    }
                    cond = nonzero;
                }
                emitln("    br i1 " + cond + ", label %" + block_label(t.if_true) + ", label %" +
                       block_label(t.if_false));
            } else if constexpr (std::is_same_v<T, ir::IrJmpMatch>) {
                std::string value = emit_expr(t.variant);
                std::string tag = new_temp();
                emitln("    " + tag + " = extractvalue " + llvm_type(t.variant.ty) + " " + value +
                       ", 0");

                std::string line = "    switch i32 " + tag + ", label %" +
                                   block_label(t.default_jmp) + " [";
                for (const auto& [disc, target] : t.discriminants) {
                    line += " i32 " + std::to_string(disc.raw()) + ", label %" +
                            block_label(target);
                }
                line += " ]";
                emitln(line);
            }
        },
        term.kind);
}

} // namespace spark::codegen
