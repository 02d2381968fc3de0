//! # IR Types
//!
//! The closed set of types every IR value is annotated with. Types are
//! interned by `IrContext`; everything else refers to them through `TypeId`.
//!
//! ## Identity
//!
//! Structural types compare field by field, so two `*i32` requests yield the
//! same handle. `IrAliasType` is nominal: it compares and hashes by name
//! alone, which lets an alias be interned before its underlying type exists
//! and later completed in place (recursive types).

#pragma once

#include "arena/arena.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace spark::ir {

struct IrType;

/// Handle of an interned type.
using TypeId = arena::Index<IrType>;

/// Position of a variant inside an `IrSumType`.
using DiscriminantId = arena::Index<TypeId>;

struct IrIntegerType {
    bool is_signed;
    uint8_t width; ///< 8, 16, 32 or 64

    [[nodiscard]] auto operator==(const IrIntegerType& other) const -> bool = default;
};

struct IrFloatType {
    bool doublewide;

    [[nodiscard]] auto operator==(const IrFloatType& other) const -> bool = default;
};

struct IrBoolType {
    [[nodiscard]] auto operator==(const IrBoolType& other) const -> bool = default;
};

struct IrUnitType {
    [[nodiscard]] auto operator==(const IrUnitType& other) const -> bool = default;
};

/// Placeholder produced after a reported error.
struct IrInvalidType {
    [[nodiscard]] auto operator==(const IrInvalidType& other) const -> bool = default;
};

struct IrPtrType {
    TypeId pointee;

    [[nodiscard]] auto operator==(const IrPtrType& other) const -> bool = default;
};

struct IrArrayType {
    TypeId element;
    uint64_t len;

    [[nodiscard]] auto operator==(const IrArrayType& other) const -> bool = default;
};

struct IrStructField {
    TypeId ty;
    std::string name;

    [[nodiscard]] auto operator==(const IrStructField& other) const -> bool = default;
};

struct IrStructType {
    std::vector<IrStructField> fields;

    /// Index of the field called `name`.
    [[nodiscard]] auto field_index(const std::string& name) const -> std::optional<uint32_t>;

    [[nodiscard]] auto operator==(const IrStructType& other) const -> bool = default;
};

struct IrSumType {
    std::vector<TypeId> variants;

    /// Discriminant of `variant`, if this sum lists it.
    [[nodiscard]] auto discriminant(TypeId variant) const -> std::optional<DiscriminantId>;

    [[nodiscard]] auto operator==(const IrSumType& other) const -> bool = default;
};

struct IrFunArg {
    TypeId ty;
    std::optional<std::string> name;

    [[nodiscard]] auto operator==(const IrFunArg& other) const -> bool = default;
};

struct IrFunType {
    std::vector<IrFunArg> args;
    TypeId return_ty;

    [[nodiscard]] auto operator==(const IrFunType& other) const -> bool = default;
};

/// A named type. Identity is the name; `underlying` is `INVALID` until the
/// alias is defined.
struct IrAliasType {
    std::string name;
    TypeId underlying;

    [[nodiscard]] auto operator==(const IrAliasType& other) const -> bool {
        return name == other.name;
    }
};

struct IrType {
    std::variant<IrIntegerType, IrFloatType, IrBoolType, IrUnitType, IrPtrType, IrArrayType,
                 IrStructType, IrSumType, IrFunType, IrAliasType, IrInvalidType>
        kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto get_if() const -> const T* {
        return std::get_if<T>(&kind);
    }

    [[nodiscard]] auto operator==(const IrType& other) const -> bool = default;
};

/// Structural hash consistent with `IrType::operator==`.
struct IrTypeHash {
    auto operator()(const IrType& ty) const -> size_t;
};

} // namespace spark::ir
