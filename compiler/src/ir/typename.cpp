//! # Typename Formatter
//!
//! | Type            | Display                          |
//! |-----------------|----------------------------------|
//! | integers        | `i8` .. `u64`                    |
//! | pointer         | `*T`                             |
//! | array           | `[N]T`                           |
//! | struct          | `{T a,U b,}`                     |
//! | sum             | `T | U | `                       |
//! | function        | `fun (T a, U , ) -> R`           |
//! | alias           | its name                         |

#include "ir/ir.hpp"

#include <sstream>

namespace spark::ir {

void TypenameFormatter::write(std::ostream& os) const {
    const IrType& ty = ctx_.type(ty_);

    std::visit(
        [this, &os](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, IrIntegerType>) {
                os << (t.is_signed ? 'i' : 'u') << static_cast<int>(t.width);
            } else if constexpr (std::is_same_v<T, IrFloatType>) {
                os << (t.doublewide ? "f64" : "f32");
            } else if constexpr (std::is_same_v<T, IrBoolType>) {
                os << "bool";
            } else if constexpr (std::is_same_v<T, IrUnitType>) {
                os << "()";
            } else if constexpr (std::is_same_v<T, IrInvalidType>) {
                os << "INVALID";
            } else if constexpr (std::is_same_v<T, IrPtrType>) {
                os << '*' << ctx_.typename_of(t.pointee);
            } else if constexpr (std::is_same_v<T, IrArrayType>) {
                os << '[' << t.len << ']' << ctx_.typename_of(t.element);
            } else if constexpr (std::is_same_v<T, IrStructType>) {
                os << '{';
                for (const auto& field : t.fields) {
                    os << ctx_.typename_of(field.ty) << ' ' << field.name << ',';
                }
                os << '}';
            } else if constexpr (std::is_same_v<T, IrSumType>) {
                for (const auto& variant : t.variants) {
                    os << ctx_.typename_of(variant) << " | ";
                }
            } else if constexpr (std::is_same_v<T, IrFunType>) {
                os << "fun (";
                for (const auto& arg : t.args) {
                    os << ctx_.typename_of(arg.ty) << ' ' << arg.name.value_or("") << ", ";
                }
                os << ") -> " << ctx_.typename_of(t.return_ty);
            } else if constexpr (std::is_same_v<T, IrAliasType>) {
                // By name only; recursive aliases would not terminate otherwise.
                os << t.name;
            }
        },
        ty.kind);
}

auto operator<<(std::ostream& os, const TypenameFormatter& fmt) -> std::ostream& {
    fmt.write(os);
    return os;
}

auto IrContext::type_name(TypeId id) const -> std::string {
    std::ostringstream oss;
    oss << typename_of(id);
    return oss.str();
}

} // namespace spark::ir
