//! # IR to LLVM IR Code Generator
//!
//! Translates the functions of an `IrContext` to LLVM IR in textual form.
//! The text uses typed pointers (`i32*`), the syntax understood by the LLVM
//! release the backend links against.
//!
//! ## Pipeline
//!
//! ```
//! AST -> IrLowerer -> IrContext -> IrCodegen -> LLVM IR text -> LLVMBackend -> object
//! ```
//!
//! ## Memory Model
//!
//! Every IR variable lives in a stack slot (`alloca`) created in a synthetic
//! `entry` block that then branches to the function's first real block.
//! Stores write the slot, reads load it; LLVM's mem2reg pass promotes the
//! slots to registers.
//!
//! ## Type Mapping
//!
//! | IR type       | LLVM type                       |
//! |---------------|---------------------------------|
//! | `iN` / `uN`   | `iN`                            |
//! | `bool`        | `i1`                            |
//! | `()`          | `{}`                            |
//! | `f32` / `f64` | `float` / `double`              |
//! | `*T`          | `T*`                            |
//! | `[N]T`        | `[N x T]`                       |
//! | struct        | `{ T1, T2 }`                    |
//! | sum           | `{ i32, [K x i64] }` (tag, payload) |
//! | function      | `R (A, B)*`                     |
//! | alias of struct or sum | named type `%"Name"`   |

#pragma once

#include "common.hpp"
#include "ir/ir.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>

namespace spark::codegen {

/// Options for IR-to-LLVM code generation.
struct IrCodegenOptions {
    bool emit_comments = true;  ///< Annotate blocks and variables with source names.
    /// Emitted as `target triple`; empty leaves it unset.
    std::string target_triple = CompilerOptions::target_triple;
};

/// IR-to-LLVM IR code generator.
class IrCodegen {
public:
    explicit IrCodegen(const ir::IrContext& ctx, IrCodegenOptions options = {});

    /// Generates a module containing every function of the context.
    auto generate(const std::string& module_name) -> std::string;

    /// LLVM spelling of an IR type.
    auto llvm_type(ir::TypeId ty) -> std::string;

    /// Size in bytes of an IR type, as laid out by `llvm_type`.
    auto type_size(ir::TypeId ty) -> uint64_t;
    auto type_align(ir::TypeId ty) -> uint64_t;

private:
    const ir::IrContext& ctx_;
    IrCodegenOptions options_;
    std::stringstream output_;

    // Current function state
    std::stringstream entry_;
    std::stringstream body_;
    int temp_counter_ = 0;
    std::unordered_set<ir::VarId> slots_;

    // Aliases whose literal type is being spelled; breaks self-reference
    // through pointers or functions.
    std::unordered_set<ir::TypeId> expanding_;

    // Module structure (ir_codegen.cpp)
    void emit_preamble(const std::string& module_name);
    void emit_type_defs();
    void emit_function(ir::FunId fun);
    void emit_function_declaration(ir::FunId fun);
    void emit_block(ir::BBId bb);
    void emit_stmt(const ir::IrStmt& stmt);

    // Terminators (terminators.cpp)
    void emit_terminator(const ir::IrTerminator& term);

    // Types (types.cpp)
    auto aggregate_literal(ir::TypeId ty) -> std::string;
    auto sum_payload_words(const ir::IrSumType& sum) -> uint64_t;
    auto is_signed(ir::TypeId ty) const -> bool;
    [[nodiscard]] auto is_named_aggregate(ir::TypeId ty) const -> bool;

    // Values (exprs.cpp)
    auto emit_expr(const ir::IrExpr& expr) -> std::string;
    auto emit_address(const ir::IrExpr& expr) -> std::optional<std::string>;
    auto emit_binary(const ir::IrBinary& bin) -> std::string;
    auto emit_unary(const ir::IrExpr& expr, const ir::IrUnary& un) -> std::string;
    auto emit_cast(const ir::IrExpr& expr, const ir::IrCast& cast) -> std::string;
    auto emit_call(const ir::IrExpr& expr, const ir::IrCall& call) -> std::string;
    auto emit_make_variant(const ir::IrExpr& expr, const ir::IrMakeVariant& mv) -> std::string;
    auto emit_variant_payload(const ir::IrExpr& expr, const ir::IrVariantPayload& vp)
        -> std::string;
    auto emit_literal(const ir::IrExpr& expr) -> std::string;
    /// Converts an integer value between widths, honouring `from`'s signedness.
    auto coerce_int(const std::string& value, ir::TypeId from, const std::string& to_llvm)
        -> std::string;
    /// Stores `value` in a fresh stack slot and returns the slot.
    auto spill(const std::string& value, const std::string& llvm_ty) -> std::string;
    /// Address of the tag and payload fields of a sum value in memory.
    auto sum_payload_ptr(const std::string& sum_addr, ir::TypeId sum_ty,
                         ir::TypeId payload_ty) -> std::string;

    // Helpers (ir_codegen.cpp)
    auto new_temp() -> std::string;
    auto var_slot(ir::VarId var) -> std::string;
    static auto block_label(ir::BBId bb) -> std::string;
    auto fun_symbol(ir::FunId fun) const -> std::string;
    void emitln(const std::string& s = "");
    void emit_comment(const std::string& s);
};

} // namespace spark::codegen
