/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the CSVBIND library */
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace csvbind {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 2;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

#ifdef CSVBIND_DEBUG_OUTPUTS
    constexpr bool DEBUG_OUTPUTS = true;
#else
    constexpr bool DEBUG_OUTPUTS = false;
#endif

    constexpr size_t  DEFAULT_CHUNK_SIZE = 10000;   // rows buffered per decode chunk
    constexpr int     NO_COLUMN          = -1;      // column index of errors not bound to a cell
    constexpr int64_t LINE_UNKNOWN       = -1;      // source line when the row source cannot tell

    template<typename>
    inline constexpr bool always_false = false;

    // Kind of value stored in a column, pointers (std::optional, std::unique_ptr) report their pointee
    enum class ColumnKind : uint8_t {
        BOOL,
        INT8,
        INT16,
        INT32,
        INT64,
        UINT8,
        UINT16,
        UINT32,
        UINT64,
        FLOAT,
        DOUBLE,
        STRING,
        ANY,
        ENUM,
        TEXT,           // type with stream extraction/insertion operators
        CUSTOM,         // type with unmarshalCSV/marshalCSV members
        UNSUPPORTED
    };

    template<typename T>
    constexpr ColumnKind integerKind() {
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1)      return ColumnKind::INT8;
            else if constexpr (sizeof(T) == 2) return ColumnKind::INT16;
            else if constexpr (sizeof(T) == 4) return ColumnKind::INT32;
            else                               return ColumnKind::INT64;
        } else {
            if constexpr (sizeof(T) == 1)      return ColumnKind::UINT8;
            else if constexpr (sizeof(T) == 2) return ColumnKind::UINT16;
            else if constexpr (sizeof(T) == 4) return ColumnKind::UINT32;
            else                               return ColumnKind::UINT64;
        }
    }

    inline std::string kindToString(ColumnKind kind) {
        switch (kind) {
            case ColumnKind::BOOL: return "bool";
            case ColumnKind::INT8: return "int8";
            case ColumnKind::INT16: return "int16";
            case ColumnKind::INT32: return "int32";
            case ColumnKind::INT64: return "int64";
            case ColumnKind::UINT8: return "uint8";
            case ColumnKind::UINT16: return "uint16";
            case ColumnKind::UINT32: return "uint32";
            case ColumnKind::UINT64: return "uint64";
            case ColumnKind::FLOAT: return "float";
            case ColumnKind::DOUBLE: return "double";
            case ColumnKind::STRING: return "string";
            case ColumnKind::ANY: return "any";
            case ColumnKind::ENUM: return "enum";
            case ColumnKind::TEXT: return "text";
            case ColumnKind::CUSTOM: return "custom";
            default: return "unsupported";
        }
    }

    inline bool isNumericKind(ColumnKind kind) {
        return kind >= ColumnKind::INT8 && kind <= ColumnKind::DOUBLE;
    }

    // Named parameters handed to localization functions and message templates
    using ParamValue   = std::variant<std::string, int64_t, double, bool>;
    using ParameterMap = std::map<std::string, ParamValue>;

    template<typename V>
    ParamValue makeParam(V value) {
        if constexpr (std::is_same_v<V, bool>) {
            return ParamValue(std::in_place_type<bool>, value);
        } else if constexpr (std::is_integral_v<V> || std::is_enum_v<V>) {
            return ParamValue(std::in_place_type<int64_t>, static_cast<int64_t>(value));
        } else if constexpr (std::is_floating_point_v<V>) {
            return ParamValue(std::in_place_type<double>, static_cast<double>(value));
        } else {
            return ParamValue(std::in_place_type<std::string>, std::string(value));
        }
    }

    inline std::string paramToString(const ParamValue& value) {
        return std::visit([](auto&& arg) -> std::string {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return arg;
            } else if constexpr (std::is_same_v<T, bool>) {
                return arg ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(arg);
            } else {
                char buf[64];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), arg);
                return ec == std::errc{} ? std::string(buf, ptr) : std::string{};
            }
        }, value);
    }

    // Translates a key with parameters, std::nullopt signals a missing translation
    using LocalizationFunc = std::function<std::optional<std::string>(const std::string& key,
                                                                      const ParameterMap& params)>;

    // Transforms raw cell text before decoding or after encoding
    using ProcessorFunc = std::function<std::string(std::string_view text)>;

} // namespace csvbind
