//! # IR Verifier
//!
//! Structural checks run after a function body is lowered. Every failure is
//! a lowering bug, never a user error, and raises `InternalError`.
//!
//! Checked for each block reachable from the entry:
//! - the block has a terminator
//! - every block, variable and type handle it mentions exists
//! - `JmpMatch` discriminants name variants of the matched sum

#pragma once

#include "ir/ir.hpp"

#include <vector>

namespace spark::ir {

/// Blocks reachable from the entry of `fun`, in breadth-first order. Empty for
/// declared functions.
[[nodiscard]] auto reachable_blocks(const IrContext& ctx, FunId fun) -> std::vector<BBId>;

/// Throws `InternalError` on the first broken invariant.
void verify_fun(const IrContext& ctx, FunId fun);

} // namespace spark::ir
