//! # IR Values
//!
//! Expression trees computing values inside basic blocks. Every node carries
//! its resolved static type, set once when it is lowered, and the source span
//! it came from.

#pragma once

#include "ast/ast.hpp"
#include "ir/types.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace spark::ir {

struct IrFun;
struct IrBB;
struct IrVar;

using FunId = arena::Index<IrFun>;
using BBId = arena::Index<IrBB>;
using VarId = arena::Index<IrVar>;

struct IrExpr;

struct IrIntLiteral {
    uint64_t value;
};

struct IrFloatLiteral {
    double value;
};

struct IrBoolLiteral {
    bool value;
};

struct IrUnitLiteral {};

/// Current value of a local variable.
struct IrVarRef {
    VarId var;
};

/// Incoming argument of the enclosing function.
struct IrArgRef {
    uint32_t index;
};

/// Address of a function.
struct IrFunRef {
    FunId fun;
};

struct IrBinary {
    Box<IrExpr> lhs;
    ast::Op op;
    Box<IrExpr> rhs;
};

struct IrUnary {
    ast::Op op;
    Box<IrExpr> operand;
};

/// Conversion to the node's own `ty`.
struct IrCast {
    Box<IrExpr> expr;
};

struct IrMember {
    Box<IrExpr> base;
    uint32_t field;
};

struct IrCall {
    Box<IrExpr> callee;
    std::vector<IrExpr> args;
};

/// Builds a sum value (the node's `ty`) holding `value` as variant `disc`.
struct IrMakeVariant {
    DiscriminantId disc;
    Box<IrExpr> value;
};

/// Payload of a sum value known to hold variant `disc`.
struct IrVariantPayload {
    Box<IrExpr> sum;
    DiscriminantId disc;
};

struct IrExpr {
    Span span;
    TypeId ty;
    std::variant<IrIntLiteral, IrFloatLiteral, IrBoolLiteral, IrUnitLiteral, IrVarRef, IrArgRef,
                 IrFunRef, IrBinary, IrUnary, IrCast, IrMember, IrCall, IrMakeVariant,
                 IrVariantPayload>
        kind;
};

/// Any value operand of a statement or terminator.
using IrAnyValue = IrExpr;

} // namespace spark::ir
