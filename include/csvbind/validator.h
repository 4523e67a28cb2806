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
 * @file validator.h
 * @brief Value validators run on decoded cells.
 *
 * A validator sees the decoded value through a ValueRef and must match its
 * exact type: validators::lt(100) accepts an int column only, use
 * validators::lt(int64_t{100}) for an int64_t column. String literals bind
 * to std::string columns.
 *
 *     cfg.column("age").validators  = { csvbind::validators::range(0, 150) };
 *     cfg.column("name").validators = { csvbind::validators::strLen(1, 32) };
 */

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.h"
#include "value_ref.h"

namespace csvbind {

    using ValidatorFunc = std::function<Error(const ValueRef& value)>;

    namespace validators {

        namespace detail {

            template<typename T>
            struct Validated { using type = T; };
            template<>
            struct Validated<const char*> { using type = std::string; };
            template<>
            struct Validated<char*> { using type = std::string; };
            template<>
            struct Validated<std::string_view> { using type = std::string; };

            template<typename T>
            using ValidatedType = typename Validated<std::decay_t<T>>::type;

            inline std::string refTypeName(const ValueRef& value) {
                if (value.empty()) {
                    return "nil";
                }
                if (value.kind() != ColumnKind::UNSUPPORTED) {
                    return kindToString(value.kind());
                }
                return value.type().name();
            }

            template<typename T>
            std::string targetTypeName() {
                constexpr ColumnKind kind = builtinKind<T>();
                if constexpr (kind != ColumnKind::UNSUPPORTED) {
                    return kindToString(kind);
                } else {
                    return typeid(T).name();
                }
            }

            template<typename T>
            Error convert(const ValueRef& value, const T*& out) {
                out = value.as<T>();
                if (out == nullptr) {
                    return Error(Errc::ValidationConversion,
                                 "(" + refTypeName(value) + " -> " + targetTypeName<T>() + ")");
                }
                return {};
            }

            // Number of UTF-8 code points, continuation bytes are not counted
            inline size_t runeCount(std::string_view s) {
                size_t count = 0;
                for (char c : s) {
                    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) count++;
                }
                return count;
            }

        } // namespace detail

        template<typename B>
        ValidatorFunc lt(B bound) {
            using T = detail::ValidatedType<B>;
            return [limit = T(std::move(bound))](const ValueRef& value) -> Error {
                const T* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return *v < limit ? Error{} : Error(Errc::ValidationLT);
            };
        }

        template<typename B>
        ValidatorFunc lte(B bound) {
            using T = detail::ValidatedType<B>;
            return [limit = T(std::move(bound))](const ValueRef& value) -> Error {
                const T* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return *v <= limit ? Error{} : Error(Errc::ValidationLTE);
            };
        }

        template<typename B>
        ValidatorFunc gt(B bound) {
            using T = detail::ValidatedType<B>;
            return [limit = T(std::move(bound))](const ValueRef& value) -> Error {
                const T* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return *v > limit ? Error{} : Error(Errc::ValidationGT);
            };
        }

        template<typename B>
        ValidatorFunc gte(B bound) {
            using T = detail::ValidatedType<B>;
            return [limit = T(std::move(bound))](const ValueRef& value) -> Error {
                const T* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return *v >= limit ? Error{} : Error(Errc::ValidationGTE);
            };
        }

        // Inclusive on both ends
        template<typename B>
        ValidatorFunc range(B min, B max) {
            using T = detail::ValidatedType<B>;
            return [lo = T(std::move(min)), hi = T(std::move(max))](const ValueRef& value) -> Error {
                const T* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return (lo <= *v && *v <= hi) ? Error{} : Error(Errc::ValidationRange);
            };
        }

        template<typename B>
        ValidatorFunc in(std::initializer_list<B> allowed) {
            using T = detail::ValidatedType<B>;
            std::vector<T> values(allowed.begin(), allowed.end());
            return [values = std::move(values)](const ValueRef& value) -> Error {
                const T* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                for (const T& candidate : values) {
                    if (*v == candidate) return {};
                }
                return Error(Errc::ValidationIN);
            };
        }

        /**
         * @brief Length of a string column within [minLen, maxLen], -1 disables a bound.
         * @param lengthFn  length measure, UTF-8 code points when empty
         */
        inline ValidatorFunc strLen(int64_t minLen, int64_t maxLen,
                                    std::function<int64_t(std::string_view)> lengthFn = {}) {
            return [minLen, maxLen, lengthFn = std::move(lengthFn)](const ValueRef& value) -> Error {
                const std::string* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                const int64_t length = lengthFn ? lengthFn(*v) : static_cast<int64_t>(detail::runeCount(*v));
                if ((minLen == -1 || minLen <= length) && (maxLen == -1 || length <= maxLen)) {
                    return {};
                }
                return Error(Errc::ValidationStrLen);
            };
        }

        inline ValidatorFunc strPrefix(std::string prefix) {
            return [prefix = std::move(prefix)](const ValueRef& value) -> Error {
                const std::string* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return v->starts_with(prefix) ? Error{} : Error(Errc::ValidationStrPrefix);
            };
        }

        inline ValidatorFunc strSuffix(std::string suffix) {
            return [suffix = std::move(suffix)](const ValueRef& value) -> Error {
                const std::string* v = nullptr;
                if (Error err = detail::convert(value, v)) return err;
                return v->ends_with(suffix) ? Error{} : Error(Errc::ValidationStrSuffix);
            };
        }

    } // namespace validators

} // namespace csvbind
