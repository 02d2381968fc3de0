//! # IR Codegen Type Conversion
//!
//! - llvm_type: spells an IR type as an LLVM type
//! - type_size / type_align: byte layout, used to size sum payloads
//!
//! A sum is a 32-bit tag followed by enough 64-bit words to hold its largest
//! variant.

#include "codegen/ir_codegen.hpp"

#include <algorithm>

namespace spark::codegen {

using ir::TypeId;

auto IrCodegen::is_named_aggregate(TypeId ty) const -> bool {
    if (!ctx_.type(ty).is<ir::IrAliasType>()) {
        return false;
    }
    const ir::IrType& under = ctx_.type(ctx_.unwrap_alias(ty));
    return under.is<ir::IrStructType>() || under.is<ir::IrSumType>();
}

auto IrCodegen::is_signed(TypeId ty) const -> bool {
    const auto* it = ctx_.type(ctx_.unwrap_alias(ty)).get_if<ir::IrIntegerType>();
    return it && it->is_signed;
}

auto IrCodegen::sum_payload_words(const ir::IrSumType& sum) -> uint64_t {
    uint64_t max_size = 0;
    for (TypeId variant : sum.variants) {
        max_size = std::max(max_size, type_size(variant));
    }
    return (max_size + 7) / 8;
}

auto IrCodegen::aggregate_literal(TypeId ty) -> std::string {
    const ir::IrType& t = ctx_.type(ty);

    if (const auto* st = t.get_if<ir::IrStructType>()) {
        if (st->fields.empty()) {
            return "{}";
        }
        std::string result = "{ ";
        for (size_t i = 0; i < st->fields.size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += llvm_type(st->fields[i].ty);
        }
        result += " }";
        return result;
    }

    const auto& sum = t.as<ir::IrSumType>();
    return "{ i32, [" + std::to_string(sum_payload_words(sum)) + " x i64] }";
}

auto IrCodegen::llvm_type(TypeId ty) -> std::string {
    const ir::IrType& t = ctx_.type(ty);

    return std::visit(
        [this, ty](const auto& k) -> std::string {
            using T = std::decay_t<decltype(k)>;

            if constexpr (std::is_same_v<T, ir::IrIntegerType>) {
                return "i" + std::to_string(k.width);
            } else if constexpr (std::is_same_v<T, ir::IrFloatType>) {
                return k.doublewide ? "double" : "float";
            } else if constexpr (std::is_same_v<T, ir::IrBoolType>) {
                return "i1";
            } else if constexpr (std::is_same_v<T, ir::IrUnitType>) {
                return "{}";
            } else if constexpr (std::is_same_v<T, ir::IrPtrType>) {
                return llvm_type(k.pointee) + "*";
            } else if constexpr (std::is_same_v<T, ir::IrArrayType>) {
                return "[" + std::to_string(k.len) + " x " + llvm_type(k.element) + "]";
            } else if constexpr (std::is_same_v<T, ir::IrStructType> ||
                                 std::is_same_v<T, ir::IrSumType>) {
                return aggregate_literal(ty);
            } else if constexpr (std::is_same_v<T, ir::IrFunType>) {
                std::string result = llvm_type(k.return_ty) + " (";
                for (size_t i = 0; i < k.args.size(); ++i) {
                    if (i > 0) {
                        result += ", ";
                    }
                    result += llvm_type(k.args[i].ty);
                }
                result += ")*";
                return result;
            } else if constexpr (std::is_same_v<T, ir::IrAliasType>) {
                if (is_named_aggregate(ty)) {
                    return "%\"" + k.name + "\"";
                }
                // Self-reference through a pointer: no LLVM spelling, use bytes.
                if (!expanding_.insert(ty).second) {
                    return "i8";
                }
                std::string result = llvm_type(k.underlying);
                expanding_.erase(ty);
                return result;
            } else {
                internal_error("codegen", "INVALID type reached code generation");
            }
        },
        t.kind);
}

auto IrCodegen::type_align(TypeId ty) -> uint64_t {
    const ir::IrType& t = ctx_.type(ctx_.unwrap_alias(ty));

    if (const auto* it = t.get_if<ir::IrIntegerType>()) {
        return it->width / 8;
    }
    if (const auto* ft = t.get_if<ir::IrFloatType>()) {
        return ft->doublewide ? 8 : 4;
    }
    if (const auto* at = t.get_if<ir::IrArrayType>()) {
        return type_align(at->element);
    }
    if (const auto* st = t.get_if<ir::IrStructType>()) {
        uint64_t align = 1;
        for (const auto& field : st->fields) {
            align = std::max(align, type_align(field.ty));
        }
        return align;
    }
    if (t.is<ir::IrPtrType>() || t.is<ir::IrFunType>() || t.is<ir::IrSumType>()) {
        return 8;
    }
    return 1;
}

auto IrCodegen::type_size(TypeId ty) -> uint64_t {
    const ir::IrType& t = ctx_.type(ctx_.unwrap_alias(ty));

    if (const auto* it = t.get_if<ir::IrIntegerType>()) {
        return it->width / 8;
    }
    if (const auto* ft = t.get_if<ir::IrFloatType>()) {
        return ft->doublewide ? 8 : 4;
    }
    if (t.is<ir::IrBoolType>()) {
        return 1;
    }
    if (t.is<ir::IrPtrType>() || t.is<ir::IrFunType>()) {
        return 8;
    }
    if (const auto* at = t.get_if<ir::IrArrayType>()) {
        return at->len * type_size(at->element);
    }
    if (const auto* st = t.get_if<ir::IrStructType>()) {
        uint64_t offset = 0;
        for (const auto& field : st->fields) {
            uint64_t align = type_align(field.ty);
            offset = (offset + align - 1) / align * align + type_size(field.ty);
        }
        uint64_t align = type_align(ctx_.unwrap_alias(ty));
        return (offset + align - 1) / align * align;
    }
    if (const auto* sum = t.get_if<ir::IrSumType>()) {
        return 8 + 8 * sum_payload_words(*sum);
    }
    return 0;
}

} // namespace spark::codegen
