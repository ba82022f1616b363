#ifndef PARG_VALUE_HPP
#define PARG_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace parg {

__extension__ typedef unsigned __int128 uint128;
__extension__ typedef __int128 int128;

// Declared value type of an argument. The ordinal is also the index of the
// matching alternative in `Value`.
enum class ValueKind : std::size_t {
    U8,
    U16,
    U32,
    U64,
    U128,
    Usize,
    I8,
    I16,
    I32,
    I64,
    I128,
    Isize,
    F32,
    F64,
    Bool,
    Char,
    String,
};

inline constexpr std::size_t kValueKindCount = static_cast<std::size_t>(ValueKind::String) + 1;

// Usize/U64 and Isize/I64 may name the same C++ type; alternatives are told apart by index only.
using Value = std::variant<std::uint8_t,
                           std::uint16_t,
                           std::uint32_t,
                           std::uint64_t,
                           uint128,
                           std::size_t,
                           std::int8_t,
                           std::int16_t,
                           std::int32_t,
                           std::int64_t,
                           int128,
                           std::ptrdiff_t,
                           float,
                           double,
                           bool,
                           char32_t,
                           std::string>;

static_assert(std::variant_size_v<Value> == kValueKindCount, "Value alternatives must follow ValueKind");

template <ValueKind K>
struct KindType {
    using type = std::variant_alternative_t<static_cast<std::size_t>(K), Value>;
};

template <ValueKind K>
using KindType_t = typename KindType<K>::type;

template <ValueKind K>
Value makeValue(KindType_t<K> v) {
    return Value(std::in_place_index<static_cast<std::size_t>(K)>, std::move(v));
}

inline ValueKind kindOf(const Value& v) { return static_cast<ValueKind>(v.index()); }

// "u8", "i128", "f64", "bool", "char", "String", ...
std::string_view kindName(ValueKind kind);

// True if `T` is the native C++ type a value of `kind` is read back as.
template <typename T>
bool nativeTypeMatches(ValueKind kind) {
    switch (kind) {
        case ValueKind::U8: return std::is_same_v<T, KindType_t<ValueKind::U8>>;
        case ValueKind::U16: return std::is_same_v<T, KindType_t<ValueKind::U16>>;
        case ValueKind::U32: return std::is_same_v<T, KindType_t<ValueKind::U32>>;
        case ValueKind::U64: return std::is_same_v<T, KindType_t<ValueKind::U64>>;
        case ValueKind::U128: return std::is_same_v<T, KindType_t<ValueKind::U128>>;
        case ValueKind::Usize: return std::is_same_v<T, KindType_t<ValueKind::Usize>>;
        case ValueKind::I8: return std::is_same_v<T, KindType_t<ValueKind::I8>>;
        case ValueKind::I16: return std::is_same_v<T, KindType_t<ValueKind::I16>>;
        case ValueKind::I32: return std::is_same_v<T, KindType_t<ValueKind::I32>>;
        case ValueKind::I64: return std::is_same_v<T, KindType_t<ValueKind::I64>>;
        case ValueKind::I128: return std::is_same_v<T, KindType_t<ValueKind::I128>>;
        case ValueKind::Isize: return std::is_same_v<T, KindType_t<ValueKind::Isize>>;
        case ValueKind::F32: return std::is_same_v<T, KindType_t<ValueKind::F32>>;
        case ValueKind::F64: return std::is_same_v<T, KindType_t<ValueKind::F64>>;
        case ValueKind::Bool: return std::is_same_v<T, KindType_t<ValueKind::Bool>>;
        case ValueKind::Char: return std::is_same_v<T, KindType_t<ValueKind::Char>>;
        case ValueKind::String: return std::is_same_v<T, KindType_t<ValueKind::String>>;
    }
    return false;
}

// Converts one token to a value of `kind`.
// Throws std::invalid_argument whose what() is the reason the token was rejected.
Value parseValue(ValueKind kind, std::string_view token);

// Integers in base 10, floats as the shortest text that reads back to the same
// value (no exponent), chars as UTF-8.
std::string formatValue(const Value& v);

std::string toString(uint128 v);
std::string toString(int128 v);

} // namespace parg

#endif // PARG_VALUE_HPP
