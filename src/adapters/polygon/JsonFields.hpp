#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

namespace adapters::polygon::json {

inline std::int64_t to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

inline double to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

inline const boost::json::value& require(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || value->is_null()) {
        throw std::runtime_error(std::string{"missing field '"} + field + "'");
    }
    return *value;
}

inline std::optional<std::int64_t> optional_int64(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return to_int64(*value);
}

inline std::string string_or_empty(const boost::json::object& obj, const char* field) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || !value->is_string()) {
        return {};
    }
    const auto& str = value->as_string();
    return std::string(str.data(), str.size());
}

}  // namespace adapters::polygon::json
