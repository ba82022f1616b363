#include "parg/value.hpp"

#include "parg/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace {

constexpr const char* kEmptyInteger = "cannot parse integer from empty string";
constexpr const char* kInvalidDigit = "invalid digit found in string";
constexpr const char* kPosOverflow = "number too large to fit in target type";
constexpr const char* kNegOverflow = "number too small to fit in target type";
constexpr const char* kInvalidFloat = "invalid float literal";
constexpr const char* kInvalidBool = "provided string was not `true` or `false`";
constexpr const char* kEmptyChar = "cannot parse char from empty string";
constexpr const char* kTooManyChars = "too many characters in string";
constexpr const char* kInvalidUtf8 = "invalid utf-8 sequence";

// Accumulates base-10 digits into U, failing once the result would exceed `limit`.
template <typename U>
U accumulateDigits(std::string_view digits, U limit, const char* overflowReason) {
    if (digits.empty()) throw std::invalid_argument(kInvalidDigit);
    U out = 0;
    for (const char ch : digits) {
        if (ch < '0' || ch > '9') throw std::invalid_argument(kInvalidDigit);
        const U digit = static_cast<U>(ch - '0');
        if (out > static_cast<U>((limit - digit) / 10)) throw std::invalid_argument(overflowReason);
        out = static_cast<U>(out * 10 + digit);
    }
    return out;
}

template <typename U>
U parseUnsignedInt(std::string_view s) {
    if (s.empty()) throw std::invalid_argument(kEmptyInteger);
    if (s.front() == '+') s.remove_prefix(1);
    return accumulateDigits<U>(s, static_cast<U>(~U(0)), kPosOverflow);
}

// U is the unsigned counterpart of T, passed explicitly since __int128 has no std::make_unsigned in strict mode.
template <typename T, typename U>
T parseSignedInt(std::string_view s) {
    if (s.empty()) throw std::invalid_argument(kEmptyInteger);
    bool negative = false;
    if (s.front() == '+' || s.front() == '-') {
        negative = (s.front() == '-');
        s.remove_prefix(1);
    }
    const U max = static_cast<U>(static_cast<U>(~U(0)) >> 1);
    if (!negative) return static_cast<T>(accumulateDigits<U>(s, max, kPosOverflow));

    const U magnitude = accumulateDigits<U>(s, static_cast<U>(max + 1), kNegOverflow);
    if (magnitude == 0) return T(0);
    return static_cast<T>(-static_cast<T>(magnitude - 1) - 1);
}

std::size_t skipDigits(std::string_view s, std::size_t pos) {
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    return pos;
}

// [+-]? (inf | infinity | nan | digits [. digits?] | . digits) ([eE] [+-]? digits)?
// strtod alone would also take leading blanks, hex floats and nan(...) payloads.
bool isFloatLiteral(std::string_view s) {
    std::size_t pos = 0;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
    const auto body = s.substr(pos);
    if (parg::utils::equalsNoCase(body, "inf") || parg::utils::equalsNoCase(body, "infinity") ||
        parg::utils::equalsNoCase(body, "nan")) {
        return true;
    }

    const std::size_t intEnd = skipDigits(s, pos);
    bool seenDigit = intEnd > pos;
    pos = intEnd;
    if (pos < s.size() && s[pos] == '.') {
        const std::size_t fracEnd = skipDigits(s, pos + 1);
        seenDigit = seenDigit || fracEnd > pos + 1;
        pos = fracEnd;
    }
    if (!seenDigit) return false;

    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
        const std::size_t expEnd = skipDigits(s, pos);
        if (expEnd == pos) return false;
        pos = expEnd;
    }
    return pos == s.size();
}

template <typename T>
T parseFloat(std::string_view s) {
    if (s.empty() || !isFloatLiteral(s)) throw std::invalid_argument(kInvalidFloat);
    const std::string tmp(s);
    char* end = nullptr;
    // Out-of-range literals saturate to inf or 0 and are accepted as such.
    T v{};
    if constexpr (std::is_same_v<T, float>) {
        v = std::strtof(tmp.c_str(), &end);
    } else {
        v = std::strtod(tmp.c_str(), &end);
    }
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) throw std::invalid_argument(kInvalidFloat);
    return v;
}

bool parseBool(std::string_view s) {
    if (s == "true") return true;
    if (s == "false") return false;
    throw std::invalid_argument(kInvalidBool);
}

// Exactly one UTF-8 encoded code point; overlong forms and surrogates are rejected.
char32_t parseChar(std::string_view s) {
    if (s.empty()) throw std::invalid_argument(kEmptyChar);

    const auto lead = static_cast<unsigned char>(s.front());
    std::size_t len = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        len = 1;
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        throw std::invalid_argument(kInvalidUtf8);
    }
    if (s.size() < len) throw std::invalid_argument(kInvalidUtf8);

    for (std::size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) != 0x80) throw std::invalid_argument(kInvalidUtf8);
        cp = (cp << 6) | (b & 0x3F);
    }

    constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw std::invalid_argument(kInvalidUtf8);
    }
    if (s.size() != len) throw std::invalid_argument(kTooManyChars);
    return cp;
}

std::string encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

// Shortest digits that read back to `v`, always in plain decimal notation.
template <typename T>
std::string formatFloat(T v) {
    // Fixed notation of the largest double needs 309 integer digits plus a sign.
    char buf[400];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
    if (res.ec != std::errc()) throw std::invalid_argument("float does not fit the format buffer");
    return std::string(buf, res.ptr);
}

} // namespace

namespace parg {

std::string_view kindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::U8: return "u8";
        case ValueKind::U16: return "u16";
        case ValueKind::U32: return "u32";
        case ValueKind::U64: return "u64";
        case ValueKind::U128: return "u128";
        case ValueKind::Usize: return "usize";
        case ValueKind::I8: return "i8";
        case ValueKind::I16: return "i16";
        case ValueKind::I32: return "i32";
        case ValueKind::I64: return "i64";
        case ValueKind::I128: return "i128";
        case ValueKind::Isize: return "isize";
        case ValueKind::F32: return "f32";
        case ValueKind::F64: return "f64";
        case ValueKind::Bool: return "bool";
        case ValueKind::Char: return "char";
        case ValueKind::String: return "String";
    }
    return "unknown";
}

Value parseValue(ValueKind kind, std::string_view token) {
    switch (kind) {
        case ValueKind::U8: return makeValue<ValueKind::U8>(parseUnsignedInt<std::uint8_t>(token));
        case ValueKind::U16: return makeValue<ValueKind::U16>(parseUnsignedInt<std::uint16_t>(token));
        case ValueKind::U32: return makeValue<ValueKind::U32>(parseUnsignedInt<std::uint32_t>(token));
        case ValueKind::U64: return makeValue<ValueKind::U64>(parseUnsignedInt<std::uint64_t>(token));
        case ValueKind::U128: return makeValue<ValueKind::U128>(parseUnsignedInt<uint128>(token));
        case ValueKind::Usize: return makeValue<ValueKind::Usize>(parseUnsignedInt<std::size_t>(token));
        case ValueKind::I8: return makeValue<ValueKind::I8>(parseSignedInt<std::int8_t, std::uint8_t>(token));
        case ValueKind::I16: return makeValue<ValueKind::I16>(parseSignedInt<std::int16_t, std::uint16_t>(token));
        case ValueKind::I32: return makeValue<ValueKind::I32>(parseSignedInt<std::int32_t, std::uint32_t>(token));
        case ValueKind::I64: return makeValue<ValueKind::I64>(parseSignedInt<std::int64_t, std::uint64_t>(token));
        case ValueKind::I128: return makeValue<ValueKind::I128>(parseSignedInt<int128, uint128>(token));
        case ValueKind::Isize: return makeValue<ValueKind::Isize>(parseSignedInt<std::ptrdiff_t, std::size_t>(token));
        case ValueKind::F32: return makeValue<ValueKind::F32>(parseFloat<float>(token));
        case ValueKind::F64: return makeValue<ValueKind::F64>(parseFloat<double>(token));
        case ValueKind::Bool: return makeValue<ValueKind::Bool>(parseBool(token));
        case ValueKind::Char: return makeValue<ValueKind::Char>(parseChar(token));
        case ValueKind::String: return makeValue<ValueKind::String>(std::string(token));
    }
    throw std::invalid_argument("unknown value kind");
}

std::string toString(uint128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string toString(int128 v) {
    if (v >= 0) return toString(static_cast<uint128>(v));
    // Negate in the unsigned domain so the minimum value does not overflow.
    return "-" + toString(static_cast<uint128>(0) - static_cast<uint128>(v));
}

std::string formatValue(const Value& v) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return x;
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, char32_t>) {
                return encodeUtf8(x);
            } else if constexpr (std::is_same_v<T, uint128> || std::is_same_v<T, int128>) {
                return toString(x);
            } else if constexpr (std::is_floating_point_v<T>) {
                return formatFloat(x);
            } else {
                return std::to_string(x);
            }
        },
        v);
}

} // namespace parg
