// scalar.h - YAML scalar resolution and value equality
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_SCALAR_H
#define YAMLDIFF_SCALAR_H

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

namespace yamldiff {

//=============================================================================
// Scalar Type Classification
//=============================================================================

enum class ScalarType : uint8_t {
    STRING,
    INT,
    FLOAT,
    BOOL,
    TAGGED,   // Explicit application tag, compared as tag + text
};

// Core schema tags as yaml-cpp reports them
inline constexpr const char* TAG_STR = "tag:yaml.org,2002:str";
inline constexpr const char* TAG_INT = "tag:yaml.org,2002:int";
inline constexpr const char* TAG_FLOAT = "tag:yaml.org,2002:float";
inline constexpr const char* TAG_BOOL = "tag:yaml.org,2002:bool";

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
inline bool is_xdigit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
inline bool is_odigit(char c) { return c >= '0' && c <= '7'; }

//=============================================================================
// Core schema matchers (whole token)
//=============================================================================

inline bool is_yaml_bool(const char* s, size_t len) {
    if (len == 4) {
        return memcmp(s, "true", 4) == 0 || memcmp(s, "True", 4) == 0 ||
               memcmp(s, "TRUE", 4) == 0;
    }
    if (len == 5) {
        return memcmp(s, "false", 5) == 0 || memcmp(s, "False", 5) == 0 ||
               memcmp(s, "FALSE", 5) == 0;
    }
    return false;
}

inline bool bool_value(const char* s) { return s[0] == 't' || s[0] == 'T'; }

// [-+]?(0x[0-9a-fA-F]+ | 0o[0-7]+ | 0b[01]+ | [0-9]+), separators removed
inline bool is_yaml_int(const char* s, size_t len) {
    if (len == 0) return false;
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (len - i > 2 && s[i] == '0' && (s[i + 1] == 'x' || s[i + 1] == 'o' || s[i + 1] == 'b')) {
        char base = s[i + 1];
        for (size_t j = i + 2; j < len; ++j) {
            bool ok = base == 'x' ? is_xdigit(s[j])
                    : base == 'o' ? is_odigit(s[j])
                    : (s[j] == '0' || s[j] == '1');
            if (!ok) return false;
        }
        return true;
    }
    if (i >= len) return false;
    for (; i < len; ++i) {
        if (!is_digit(s[i])) return false;
    }
    return true;
}

// Drop YAML 1.2 digit separators ("1_000" -> "1000"). An underscore in a
// float exponent is kept so the text no longer matches a number.
inline std::string strip_digit_separators(const std::string& text) {
    size_t i = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    bool hex = text.size() > i + 1 && text[i] == '0' && text[i + 1] == 'x';
    bool exponent = false;
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (!hex && (c == 'e' || c == 'E')) exponent = true;
        if (c == '_' && !exponent) continue;
        out += c;
    }
    return out;
}

// Special float spellings: .inf, -.inf, +.inf, .nan (any of the three casings)
inline bool is_yaml_special_float(const char* s, size_t len) {
    size_t i = (len > 0 && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    const char* p = s + i;
    size_t n = len - i;
    if (n == 4) {
        if (memcmp(p, ".inf", 4) == 0 || memcmp(p, ".Inf", 4) == 0 ||
            memcmp(p, ".INF", 4) == 0) return true;
        if (i == 0 && (memcmp(p, ".nan", 4) == 0 || memcmp(p, ".NaN", 4) == 0 ||
                       memcmp(p, ".NAN", 4) == 0)) return true;
    }
    return false;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
inline bool is_yaml_float(const char* s, size_t len) {
    if (len == 0) return false;
    if (is_yaml_special_float(s, len)) return true;
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    size_t int_digits = 0, frac_digits = 0;
    while (i < len && is_digit(s[i])) { ++i; ++int_digits; }
    if (i < len && s[i] == '.') {
        ++i;
        while (i < len && is_digit(s[i])) { ++i; ++frac_digits; }
    }
    if (int_digits == 0 && frac_digits == 0) return false;
    if (i < len && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < len && (s[i] == '-' || s[i] == '+')) ++i;
        size_t exp_digits = 0;
        while (i < len && is_digit(s[i])) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == len;
}

//=============================================================================
// Resolved Scalar
//=============================================================================

struct ScalarValue {
    ScalarType type = ScalarType::STRING;
    std::string text;
    std::string tag;          // Only kept for TAGGED
    long long int_value = 0;
    bool int_overflow = false;
    double float_value = 0.0;
    bool bool_value = false;
};

inline double parse_yaml_float(const std::string& text) {
    const char* s = text.c_str();
    size_t len = text.size();
    if (is_yaml_special_float(s, len)) {
        if (s[len - 1] == 'n' || s[len - 1] == 'N') return std::nan("");
        return s[0] == '-' ? -HUGE_VAL : HUGE_VAL;
    }
    return std::strtod(s, nullptr);
}

inline void parse_yaml_int(const std::string& digits, ScalarValue& out) {
    const char* s = digits.c_str();
    bool negative = false;
    if (*s == '-' || *s == '+') { negative = *s == '-'; ++s; }
    int base = 10;
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'o' || s[1] == 'b')) {
        base = s[1] == 'x' ? 16 : s[1] == 'o' ? 8 : 2;
        s += 2;
    }
    errno = 0;
    long long value = std::strtoll(s, nullptr, base);
    out.int_overflow = (errno == ERANGE);
    out.int_value = negative ? -value : value;
}

// Resolve a scalar from its source text and the tag yaml-cpp reported
// ("?" for plain scalars, "!" for quoted ones, otherwise the explicit tag).
inline ScalarValue resolve_scalar(const std::string& text, const std::string& tag) {
    ScalarValue v;
    v.text = text;
    const char* s = text.c_str();
    size_t len = text.size();

    if (tag == "!" || tag == TAG_STR) return v;

    const std::string digits = text.find('_') == std::string::npos
        ? text : strip_digit_separators(text);
    const char* d = digits.c_str();
    size_t dlen = digits.size();

    if (tag == TAG_BOOL || (tag == "?" && is_yaml_bool(s, len))) {
        if (is_yaml_bool(s, len)) {
            v.type = ScalarType::BOOL;
            v.bool_value = bool_value(s);
            return v;
        }
    } else if (tag == TAG_INT || (tag == "?" && is_yaml_int(d, dlen))) {
        if (is_yaml_int(d, dlen)) {
            v.type = ScalarType::INT;
            parse_yaml_int(digits, v);
            return v;
        }
    } else if (tag == TAG_FLOAT || (tag == "?" && is_yaml_float(d, dlen))) {
        if (is_yaml_float(d, dlen)) {
            v.type = ScalarType::FLOAT;
            v.float_value = parse_yaml_float(digits);
            return v;
        }
    } else if (tag != "?" && !tag.empty()) {
        v.type = ScalarType::TAGGED;
        v.tag = tag;
        return v;
    }

    // Core tag with text that does not fit it: keep the text as a string
    return v;
}

//=============================================================================
// Equality
//=============================================================================

inline std::string format_double(double d) {
    if (std::isnan(d)) return "nan";
    if (d == 0) d = 0.0;    // -0.0 == 0.0
    char buf[32];
    snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

// Canonical form of a resolved scalar: two scalars are equal iff their
// canonical forms are. int and float share the "n:" space when the int
// converts to double exactly, so 1 == 1.0 and .nan == .nan.
inline std::string canonical_scalar(const ScalarValue& v) {
    switch (v.type) {
        case ScalarType::STRING:
            return "s:" + v.text;
        case ScalarType::BOOL:
            return v.bool_value ? "b:1" : "b:0";
        case ScalarType::TAGGED:
            return "t:" + std::to_string(v.tag.size()) + ":" + v.tag + v.text;
        case ScalarType::INT: {
            if (v.int_overflow) return "i:" + v.text;
            double d = static_cast<double>(v.int_value);
            if (d < 9223372036854775808.0 && d >= -9223372036854775808.0 &&
                static_cast<long long>(d) == v.int_value) {
                return "n:" + format_double(d);
            }
            return "i:" + std::to_string(v.int_value);
        }
        case ScalarType::FLOAT:
            return "n:" + format_double(v.float_value);
    }
    return "?";
}

inline bool scalars_equal(const ScalarValue& a, const ScalarValue& b) {
    return canonical_scalar(a) == canonical_scalar(b);
}

} // namespace yamldiff

#endif // YAMLDIFF_SCALAR_H
