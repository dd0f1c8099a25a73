#pragma once

#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace unisql {

/// True when d is finite, integral and representable as T
template <typename T>
[[nodiscard]] bool in_integer_range(double d) {
    static_assert(std::is_integral_v<T>);
    if (!std::isfinite(d) || d != std::floor(d)) return false;
    const double upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
    const double lower = std::is_signed_v<T> ? -upper : 0.0;
    return d >= lower && d < upper;
}

/// Largest magnitude a double carries without losing integer precision
inline constexpr int64_t kMaxExactJsonInteger = int64_t{1} << 53;

/**
 * @brief Thin wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies. Used for relation
 * payloads returned by the result parser and for the D1 HTTP wire format.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;
    using null_t = glz::json_t::null_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(int64_t v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    /// Integral and within int64_t range
    [[nodiscard]] bool is_number_integer() const {
        return data_.is_number() && in_integer_range<int64_t>(data_.get<double>());
    }

    // ===== Container Properties =====

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            const double d = data_.get<double>();
            if (!in_integer_range<T>(std::trunc(d))) {
                throw std::out_of_range("JSON number out of range for integer type");
            }
            return static_cast<T>(d);
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        if (!data_.is_object()) return default_value;
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it == obj.end()) return default_value;
        return JsonValue(it->second).get<T>();
    }

    // ===== Conversion to/from driver values =====

    /**
     * @brief Convert a driver value; integers keep their integral JSON form.
     *
     * An int64_t beyond +/-2^53 has no exact double, so it is written as a
     * decimal string instead.
     */
    [[nodiscard]] static JsonValue from_value(const Value& v);

    /**
     * @brief Convert a scalar to a driver value.
     * Integral numbers within int64_t range become int64_t, other numbers stay
     * double, nested arrays/objects become JSON text.
     */
    [[nodiscard]] Value to_value() const;

    // ===== Mutation (building request bodies) =====

    void set(std::string_view key, JsonValue val) {
        if (!data_.is_object()) data_ = object_t{};
        data_.get_object()[std::string(key)] = std::move(val.data_);
    }

    void push_back(JsonValue val) {
        if (!data_.is_array()) data_ = array_t{};
        data_.get_array().emplace_back(std::move(val.data_));
    }

    // ===== Iteration =====

    template <typename Fn>
    void for_each_element(Fn&& fn) const {
        if (!data_.is_array()) return;
        for (const auto& elem : data_.get_array()) {
            fn(JsonValue(elem));
        }
    }

    template <typename Fn>
    void for_each_member(Fn&& fn) const {
        if (!data_.is_object()) return;
        for (const auto& [key, val] : data_.get_object()) {
            fn(key, JsonValue(val));
        }
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue array() {
        glz::json_t j;
        j = array_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] std::string dump() const {
        std::string out;
        auto ec = glz::write_json(data_, out);
        if (ec) {
            throw parse_error("JSON serialization error");
        }
        return out;
    }

private:
    glz::json_t data_{};
};

// ============================================================================
// Inline conversions
// ============================================================================

inline JsonValue JsonValue::from_value(const Value& v) {
    return std::visit([](const auto& x) -> JsonValue {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return JsonValue(nullptr);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            if (x > kMaxExactJsonInteger || x < -kMaxExactJsonInteger) {
                return JsonValue(std::to_string(x));
            }
            return JsonValue(x);
        } else {
            return JsonValue(x);
        }
    }, v);
}

inline Value JsonValue::to_value() const {
    if (is_null()) return std::monostate{};
    if (is_boolean()) return get<bool>();
    if (is_string()) return get<std::string>();
    if (is_number()) {
        if (is_number_integer()) return get<int64_t>();
        return get<double>();
    }
    return dump();
}

} // namespace unisql
