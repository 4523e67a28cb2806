/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file codec.h
 * @brief Typed codec dispatcher - selects the text codec of a column value type.
 *
 * The codec of a type is chosen at compile time, once per column, in this order:
 *   1. custom tabular marshal: members  Error unmarshalCSV(std::string_view)
 *                                       Error marshalCSV(std::string&) const
 *   2. text capability: stream extraction (>>) / insertion (<<) of class types
 *   3. pointer variants std::optional<U> and std::unique_ptr<U> of a supported U
 *   4. built-in kinds: bool, integers of every width, float, double, enums,
 *      std::string and std::any
 *
 * Both directions are resolved separately. A type without a capability in one
 * direction yields a null function pointer which the engines report as
 * Errc::TypeUnsupported before the first row is touched.
 */

#include <any>
#include <concepts>
#include <iosfwd>
#include <string>
#include <string_view>
#include <typeindex>

#include "definitions.h"
#include "errors.h"
#include "value_ref.h"

namespace csvbind {

    // ========================================================================
    // Capability concepts
    // ========================================================================
    template<typename T>
    concept CsvUnmarshaler = requires(T& value, std::string_view text) {
        { value.unmarshalCSV(text) } -> std::same_as<Error>;
    };

    template<typename T>
    concept CsvMarshaler = requires(const T& value, std::string& out) {
        { value.marshalCSV(out) } -> std::same_as<Error>;
    };

    template<typename T>
    concept IntegerValue = std::is_integral_v<T>
        && !std::is_same_v<T, bool>     && !std::is_same_v<T, wchar_t>
        && !std::is_same_v<T, char8_t>  && !std::is_same_v<T, char16_t>
        && !std::is_same_v<T, char32_t>;

    template<typename T>
    concept FloatValue = std::is_same_v<T, float> || std::is_same_v<T, double>;

    template<typename T>
    concept EnumValue = std::is_enum_v<T> && IntegerValue<std::underlying_type_t<T>>;

    template<typename T>
    concept BuiltinValue = std::is_same_v<T, bool> || IntegerValue<T> || FloatValue<T> || EnumValue<T>
        || std::is_same_v<T, std::string> || std::is_same_v<T, std::any>;

    template<typename T>
    concept TextUnmarshaler = std::is_class_v<T> && !BuiltinValue<T> && !PointerTraits<T>::is_pointer
        && std::is_default_constructible_v<T>
        && requires(std::istream& is, T& value) {
            { is >> value } -> std::convertible_to<std::istream&>;
        };

    template<typename T>
    concept TextMarshaler = std::is_class_v<T> && !BuiltinValue<T> && !PointerTraits<T>::is_pointer
        && requires(std::ostream& os, const T& value) {
            { os << value } -> std::convertible_to<std::ostream&>;
        };

    // ========================================================================
    // Type-erased codec of one value type
    // ========================================================================
    using DecodeFn = Error (*)(std::string_view text, void* target);
    using EncodeFn = Error (*)(const void* source, bool omitEmpty, std::string& out);
    using RefFn    = ValueRef (*)(const void* source);

    struct ValueCodec {
        std::type_index         type = typeid(void);
        std::string             typeName;
        ColumnKind              kind = ColumnKind::UNSUPPORTED;
        DecodeFn                decode = nullptr;   // null when the type cannot be decoded
        EncodeFn                encode = nullptr;   // null when the type cannot be encoded
        RefFn                   ref = nullptr;      // view for validators

        bool                    canDecode() const               { return decode != nullptr; }
        bool                    canEncode() const               { return encode != nullptr; }

        template<typename V>
        static ValueCodec       of();
    };

    template<typename T> constexpr bool       isDecodable();
    template<typename T> constexpr bool       isEncodable();
    template<typename T> constexpr ColumnKind toColumnKind();
    template<typename T> std::string          typeNameOf();

    template<typename T> Error decodeValue(std::string_view text, T& out);
    template<typename T> Error encodeValue(const T& value, bool omitEmpty, std::string& out);

    Error parseBool(std::string_view text, bool& out);
    Error encodeAny(const std::any& value, bool omitEmpty, std::string& out);

} // namespace csvbind
