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
 * @file codec.hpp
 * @brief Typed codec dispatcher implementations.
 */

#include "codec.h"

#include <charconv>
#include <istream>
#include <ostream>
#include <sstream>

namespace csvbind {

    // ── Static capability queries ───────────────────────────────────────

    template<typename T>
    constexpr bool isDecodable() {
        if constexpr (CsvUnmarshaler<T> || TextUnmarshaler<T>) {
            return true;
        } else if constexpr (PointerTraits<T>::is_pointer) {
            using U = typename PointerTraits<T>::element_type;
            return std::is_default_constructible_v<U> && isDecodable<U>();
        } else {
            return BuiltinValue<T>;
        }
    }

    template<typename T>
    constexpr bool isEncodable() {
        if constexpr (CsvMarshaler<T> || TextMarshaler<T>) {
            return true;
        } else if constexpr (PointerTraits<T>::is_pointer) {
            return isEncodable<typename PointerTraits<T>::element_type>();
        } else {
            return BuiltinValue<T>;
        }
    }

    template<typename T>
    constexpr ColumnKind toColumnKind() {
        if constexpr (CsvUnmarshaler<T> || CsvMarshaler<T>)           return ColumnKind::CUSTOM;
        else if constexpr (TextUnmarshaler<T> || TextMarshaler<T>)    return ColumnKind::TEXT;
        else if constexpr (PointerTraits<T>::is_pointer)              return toColumnKind<typename PointerTraits<T>::element_type>();
        else if constexpr (EnumValue<T>)                              return ColumnKind::ENUM;
        else if constexpr (std::is_same_v<T, std::any>)               return ColumnKind::ANY;
        else if constexpr (BuiltinValue<T>)                           return builtinKind<T>();
        else                                                          return ColumnKind::UNSUPPORTED;
    }

    template<typename T>
    std::string typeNameOf() {
        if constexpr (PointerTraits<T>::is_pointer) {
            return "*" + typeNameOf<typename PointerTraits<T>::element_type>();
        } else if constexpr (std::is_same_v<T, std::any>) {
            return "any";
        } else if constexpr (BuiltinValue<T> && !EnumValue<T>) {
            return kindToString(builtinKind<T>());
        } else {
            return typeid(T).name();
        }
    }

    template<typename V>
    ValueCodec ValueCodec::of() {
        ValueCodec codec;
        codec.type     = typeid(V);
        codec.typeName = typeNameOf<V>();
        codec.kind     = toColumnKind<V>();
        if constexpr (isDecodable<V>()) {
            codec.decode = [](std::string_view text, void* target) -> Error {
                return decodeValue(text, *static_cast<V*>(target));
            };
        }
        if constexpr (isEncodable<V>()) {
            codec.encode = [](const void* source, bool omitEmpty, std::string& out) -> Error {
                return encodeValue(*static_cast<const V*>(source), omitEmpty, out);
            };
        }
        codec.ref = [](const void* source) -> ValueRef {
            return ValueRef::of(*static_cast<const V*>(source));
        };
        return codec;
    }

    // ── Decoding ────────────────────────────────────────────────────────

    namespace detail {

        inline Error decodeError(const std::string& typeName, std::string_view text) {
            return Error(Errc::DecodeValueType, typeName + " (" + std::string(text) + ")");
        }

        inline Error encodeError(const std::string& typeName, const std::string& reason) {
            return Error(Errc::EncodeValueType, typeName + " (" + reason + ")");
        }

        // Accept a leading '+' the way from_chars does not
        inline std::string_view stripPlus(std::string_view text) {
            if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
                text.remove_prefix(1);
            }
            return text;
        }

        template<typename T>
        Error parseNumber(std::string_view text, T& out) {
            std::string_view digits = text;
            if constexpr (std::is_floating_point_v<T> || std::is_signed_v<T>) {
                digits = stripPlus(text);
            }
            if (digits.empty()) {
                return decodeError(typeNameOf<T>(), text);
            }
            T value{};
            const char* end = digits.data() + digits.size();
            auto [ptr, ec] = std::from_chars(digits.data(), end, value);
            if (ec != std::errc{} || ptr != end) {
                return decodeError(typeNameOf<T>(), text);
            }
            out = value;
            return {};
        }

        template<typename T>
        void formatNumber(T value, std::string& out) {
            char buf[512];
            std::to_chars_result res;
            if constexpr (std::is_floating_point_v<T>) {
                res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
            } else {
                res = std::to_chars(buf, buf + sizeof(buf), value);
            }
            out.assign(buf, res.ptr);
        }

    } // namespace detail

    inline Error parseBool(std::string_view text, bool& out) {
        if (text == "1" || text == "t" || text == "T" || text == "TRUE" || text == "true" || text == "True") {
            out = true;
            return {};
        }
        if (text == "0" || text == "f" || text == "F" || text == "FALSE" || text == "false" || text == "False") {
            out = false;
            return {};
        }
        return detail::decodeError("bool", text);
    }

    template<typename T>
    Error decodeValue(std::string_view text, T& out) {
        if constexpr (CsvUnmarshaler<T>) {
            return out.unmarshalCSV(text);
        } else if constexpr (TextUnmarshaler<T>) {
            std::istringstream is{std::string(text)};
            is >> out;
            if (is.fail()) {
                return detail::decodeError(typeNameOf<T>(), text);
            }
            is >> std::ws;
            if (!is.eof()) {
                return detail::decodeError(typeNameOf<T>(), text);
            }
            return {};
        } else if constexpr (PointerTraits<T>::is_pointer) {
            using U = typename PointerTraits<T>::element_type;
            U value{};
            if (Error err = decodeValue(text, value)) {
                return err;
            }
            PointerTraits<T>::assign(out, std::move(value));
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return parseBool(text, out);
        } else if constexpr (EnumValue<T>) {
            std::underlying_type_t<T> raw{};
            if (Error err = detail::parseNumber(text, raw)) {
                return err;
            }
            out = static_cast<T>(raw);
            return {};
        } else if constexpr (IntegerValue<T> || FloatValue<T>) {
            return detail::parseNumber(text, out);
        } else if constexpr (std::is_same_v<T, std::string>) {
            out.assign(text);
            return {};
        } else if constexpr (std::is_same_v<T, std::any>) {
            out = std::string(text);
            return {};
        } else {
            static_assert(always_false<T>, "Unsupported type for decodeValue");
        }
    }

    // ── Encoding ────────────────────────────────────────────────────────

    template<typename T>
    Error encodeValue(const T& value, bool omitEmpty, std::string& out) {
        if constexpr (CsvMarshaler<T>) {
            out.clear();
            return value.marshalCSV(out);
        } else if constexpr (TextMarshaler<T>) {
            std::ostringstream os;
            os << value;
            if (os.fail()) {
                return detail::encodeError(typeNameOf<T>(), "stream insertion failed");
            }
            out = os.str();
            return {};
        } else if constexpr (PointerTraits<T>::is_pointer) {
            const auto* pointee = PointerTraits<T>::get(value);
            if (pointee == nullptr) {
                out.clear();
                return {};
            }
            return encodeValue(*pointee, omitEmpty, out);
        } else if constexpr (std::is_same_v<T, bool>) {
            if (omitEmpty && !value) {
                out.clear();
            } else {
                out = value ? "true" : "false";
            }
            return {};
        } else if constexpr (EnumValue<T>) {
            return encodeValue(static_cast<std::underlying_type_t<T>>(value), omitEmpty, out);
        } else if constexpr (IntegerValue<T> || FloatValue<T>) {
            if (omitEmpty && value == T{}) {
                out.clear();
                return {};
            }
            detail::formatNumber(value, out);
            return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
            out = value;
            return {};
        } else if constexpr (std::is_same_v<T, std::any>) {
            return encodeAny(value, omitEmpty, out);
        } else {
            static_assert(always_false<T>, "Unsupported type for encodeValue");
        }
    }

    namespace detail {

        template<typename... Ts>
        bool encodeAnyAs(const std::any& value, bool omitEmpty, std::string& out, Error& err) {
            return ((value.type() == typeid(Ts)
                        ? (err = encodeValue(*std::any_cast<Ts>(&value), omitEmpty, out), true)
                        : false) || ...);
        }

    } // namespace detail

    inline Error encodeAny(const std::any& value, bool omitEmpty, std::string& out) {
        if (!value.has_value()) {
            out.clear();
            return {};
        }
        Error err;
        bool handled = detail::encodeAnyAs<bool, char, signed char, unsigned char,
                                           short, unsigned short, int, unsigned int,
                                           long, unsigned long, long long, unsigned long long,
                                           float, double, std::string>(value, omitEmpty, out, err);
        if (handled) {
            return err;
        }
        if (const auto* view = std::any_cast<std::string_view>(&value)) {
            out.assign(*view);
            return {};
        }
        if (const auto* cstr = std::any_cast<const char*>(&value)) {
            out = *cstr != nullptr ? std::string(*cstr) : std::string{};
            return {};
        }
        return Error(Errc::TypeUnsupported, std::string("any holding ") + value.type().name());
    }

} // namespace csvbind
