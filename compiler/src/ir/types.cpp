//! # IR Type Identity

#include "ir/types.hpp"

#include <functional>

namespace spark::ir {

auto IrStructType::field_index(const std::string& name) const -> std::optional<uint32_t> {
    for (uint32_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

auto IrSumType::discriminant(TypeId variant) const -> std::optional<DiscriminantId> {
    for (uint32_t i = 0; i < variants.size(); ++i) {
        if (variants[i] == variant) {
            return DiscriminantId::from_raw(i);
        }
    }
    return std::nullopt;
}

static void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

auto IrTypeHash::operator()(const IrType& ty) const -> size_t {
    size_t seed = ty.kind.index();

    std::visit(
        [&seed](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, IrIntegerType>) {
                hash_combine(seed, t.is_signed);
                hash_combine(seed, t.width);
            } else if constexpr (std::is_same_v<T, IrFloatType>) {
                hash_combine(seed, t.doublewide);
            } else if constexpr (std::is_same_v<T, IrPtrType>) {
                hash_combine(seed, t.pointee.raw());
            } else if constexpr (std::is_same_v<T, IrArrayType>) {
                hash_combine(seed, t.element.raw());
                hash_combine(seed, std::hash<uint64_t>{}(t.len));
            } else if constexpr (std::is_same_v<T, IrStructType>) {
                for (const auto& field : t.fields) {
                    hash_combine(seed, field.ty.raw());
                    hash_combine(seed, std::hash<std::string>{}(field.name));
                }
            } else if constexpr (std::is_same_v<T, IrSumType>) {
                for (const auto& variant : t.variants) {
                    hash_combine(seed, variant.raw());
                }
            } else if constexpr (std::is_same_v<T, IrFunType>) {
                for (const auto& arg : t.args) {
                    hash_combine(seed, arg.ty.raw());
                    hash_combine(seed, arg.name ? std::hash<std::string>{}(*arg.name) : 0);
                }
                hash_combine(seed, t.return_ty.raw());
            } else if constexpr (std::is_same_v<T, IrAliasType>) {
                // Nominal: the underlying type is not part of the identity.
                hash_combine(seed, std::hash<std::string>{}(t.name));
            }
        },
        ty.kind);

    return seed;
}

} // namespace spark::ir
