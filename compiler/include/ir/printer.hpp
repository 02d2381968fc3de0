//! # IR Pretty Printer
//!
//! Human-readable IR for debugging and tests.
//!
//! ```text
//! fun add(i32 a, i32 b) -> i32 {
//! bb0:
//!     live %0 a: i32
//!     %0 = arg0
//!     live %1 b: i32
//!     %1 = arg1
//!     return (%0 + %1)
//! }
//! ```

#pragma once

#include "ir/ir.hpp"

#include <string>

namespace spark::ir {

class IrPrinter {
public:
    explicit IrPrinter(const IrContext& ctx) : ctx_(ctx) {}

    /// Every function in the context, in declaration order.
    auto print_context() -> std::string;
    auto print_fun(FunId fun) -> std::string;
    auto print_block(BBId bb) -> std::string;
    auto print_stmt(const IrStmt& stmt) -> std::string;
    auto print_terminator(const IrTerminator& term) -> std::string;
    auto print_expr(const IrExpr& expr) -> std::string;

private:
    const IrContext& ctx_;
};

} // namespace spark::ir
