//! # Spark IR
//!
//! A typed, control-flow-graph IR. Functions own a body made of basic
//! blocks; each block is a list of statements closed by exactly one
//! terminator. Values are expression trees (`IrExpr`).
//!
//! ## Storage
//!
//! `IrContext` owns every type, function, block and variable. Entries refer
//! to each other only through handles (`TypeId`, `FunId`, `BBId`, `VarId`),
//! which are valid for the context that issued them and stay valid for its
//! whole lifetime: nothing is ever removed.
//!
//! ## Fixed Types
//!
//! The primitive types are interned first, in a fixed order, so their
//! handles are compile-time constants (`IrContext::I32`, `IrContext::BOOL`, ...).

#pragma once

#include "arena/arena.hpp"
#include "ast/ast.hpp"
#include "ir/types.hpp"
#include "ir/value.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace spark::ir {

// ============================================================================
// Statements and Terminators
// ============================================================================

/// Marks the start of a variable's lifetime.
struct IrVarLive {
    VarId var;
};

struct IrStore {
    VarId var;
    IrAnyValue value;
};

struct IrStmt {
    std::variant<IrVarLive, IrStore> kind;
};

struct IrReturn {
    IrAnyValue value;
};

struct IrJmp {
    BBId target;
};

struct IrJmpIf {
    IrAnyValue condition;
    BBId if_true;
    BBId if_false;
};

/// Branch on the active variant of a sum value.
struct IrJmpMatch {
    IrAnyValue variant;
    std::vector<std::pair<DiscriminantId, BBId>> discriminants;
    BBId default_jmp;
};

struct IrTerminator {
    std::variant<IrReturn, IrJmp, IrJmpIf, IrJmpMatch> kind;
};

// ============================================================================
// Blocks, Variables, Functions
// ============================================================================

struct IrBB {
    std::vector<IrStmt> stmts;
    /// Empty only while the block is being lowered.
    std::optional<IrTerminator> terminator;
};

/// A local variable. Immutable once created; shadowing makes a new one.
struct IrVar {
    TypeId ty;
    std::string name;
};

struct IrBody {
    BBId entry;
    FunId parent;
};

struct IrFun {
    std::string name;
    IrFunType ty;
    FileId file;
    Span span;
    /// Empty for declared (extern) functions.
    std::optional<IrBody> body;
    ast::FunFlags flags = ast::FunFlags::None;
};

// ============================================================================
// IR Context
// ============================================================================

class TypenameFormatter;

/// Owner of all IR storage for one compilation.
class IrContext {
public:
    static constexpr TypeId I8 = TypeId::from_raw(0);
    static constexpr TypeId I16 = TypeId::from_raw(1);
    static constexpr TypeId I32 = TypeId::from_raw(2);
    static constexpr TypeId I64 = TypeId::from_raw(3);
    static constexpr TypeId U8 = TypeId::from_raw(4);
    static constexpr TypeId U16 = TypeId::from_raw(5);
    static constexpr TypeId U32 = TypeId::from_raw(6);
    static constexpr TypeId U64 = TypeId::from_raw(7);
    static constexpr TypeId BOOL = TypeId::from_raw(8);
    static constexpr TypeId UNIT = TypeId::from_raw(9);
    static constexpr TypeId F32 = TypeId::from_raw(10);
    static constexpr TypeId F64 = TypeId::from_raw(11);
    static constexpr TypeId INVALID = TypeId::from_raw(12);

    /// Fixed handle of the integer type with the given signedness and width.
    [[nodiscard]] static constexpr auto itype(bool is_signed, uint32_t width) -> TypeId {
        uint32_t slot = width == 8 ? 0 : width == 16 ? 1 : width == 32 ? 2 : 3;
        return TypeId::from_raw(slot + (is_signed ? 0 : 4));
    }

    IrContext();

    IrContext(const IrContext&) = delete;
    IrContext& operator=(const IrContext&) = delete;

    // ---- types ----

    /// Interns `ty`, returning the existing handle for an equal type.
    auto insert_type(IrType ty) -> TypeId;
    [[nodiscard]] auto type(TypeId id) const -> const IrType&;
    [[nodiscard]] auto num_types() const -> size_t {
        return types_.size();
    }

    /// Interns a nominal alias whose underlying type is not known yet.
    auto declare_alias(const std::string& name) -> TypeId;
    /// Handle of the alias called `name`, if declared.
    [[nodiscard]] auto find_alias(const std::string& name) const -> std::optional<TypeId>;
    /// Sets the underlying type of an alias declared with `declare_alias`.
    /// Defining an alias twice is an internal error.
    void define_alias(TypeId alias, TypeId underlying);
    /// Follows alias links down to a non-alias type. Undefined or cyclic
    /// aliases resolve to `INVALID`.
    [[nodiscard]] auto unwrap_alias(TypeId id) const -> TypeId;

    /// Discriminant of `variant` within `sum` (aliases unwrapped).
    [[nodiscard]] auto discriminant(TypeId sum, TypeId variant) const
        -> std::optional<DiscriminantId>;
    /// Type of variant `disc` of `sum` (aliases unwrapped).
    [[nodiscard]] auto variant_type(TypeId sum, DiscriminantId disc) const -> TypeId;

    /// Display form of a type, e.g. `*[4]{i32 x,}`.
    [[nodiscard]] auto type_name(TypeId id) const -> std::string;
    /// Streaming form of `type_name`.
    [[nodiscard]] auto typename_of(TypeId id) const -> TypenameFormatter;

    // ---- functions, blocks, variables ----

    auto insert_fun(IrFun fun) -> FunId;
    [[nodiscard]] auto fun(FunId id) const -> const IrFun&;
    [[nodiscard]] auto fun_mut(FunId id) -> IrFun&;
    [[nodiscard]] auto fun_ids() const -> std::vector<FunId> {
        return funs_.ids();
    }
    [[nodiscard]] auto num_funs() const -> size_t {
        return funs_.size();
    }
    /// Function type of `id`, interned.
    auto fun_type(FunId id) -> TypeId;

    auto insert_bb(IrBB bb = {}) -> BBId;
    [[nodiscard]] auto bb(BBId id) const -> const IrBB&;
    [[nodiscard]] auto bb_mut(BBId id) -> IrBB&;
    [[nodiscard]] auto num_bbs() const -> size_t {
        return bbs_.size();
    }

    auto insert_var(IrVar var) -> VarId;
    [[nodiscard]] auto var(VarId id) const -> const IrVar&;
    [[nodiscard]] auto num_vars() const -> size_t {
        return vars_.size();
    }

    [[nodiscard]] auto contains(TypeId id) const -> bool {
        return types_.contains(id);
    }
    [[nodiscard]] auto contains(FunId id) const -> bool {
        return funs_.contains(id);
    }
    [[nodiscard]] auto contains(BBId id) const -> bool {
        return bbs_.contains(id);
    }
    [[nodiscard]] auto contains(VarId id) const -> bool {
        return vars_.contains(id);
    }

private:
    arena::Interner<IrType, IrTypeHash> types_;
    arena::Arena<IrFun> funs_;
    arena::Arena<IrBB> bbs_;
    arena::Arena<IrVar> vars_;
};

// ============================================================================
// Typename Formatter
// ============================================================================

/// Writes the display form of a type straight into a stream, recursing into
/// nested types without building intermediate strings.
class TypenameFormatter {
public:
    TypenameFormatter(const IrContext& ctx, TypeId ty) : ctx_(ctx), ty_(ty) {}

    void write(std::ostream& os) const;

private:
    const IrContext& ctx_;
    TypeId ty_;
};

auto operator<<(std::ostream& os, const TypenameFormatter& fmt) -> std::ostream&;

} // namespace spark::ir
