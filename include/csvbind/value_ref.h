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
 * @file value_ref.h
 * @brief ValueRef - typed, read-only view of a decoded cell value.
 *
 * Validators receive the decoded value through a ValueRef. Pointer variants
 * are unwrapped, a null pointer gives an empty reference. as<T>() yields the
 * value only for an exact type match.
 */

#include <memory>
#include <optional>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "definitions.h"

namespace csvbind {

    // Pointer-like column types supported by the codec dispatcher
    template<typename T>
    struct PointerTraits {
        static constexpr bool is_pointer = false;
    };

    template<typename U>
    struct PointerTraits<std::optional<U>> {
        static constexpr bool is_pointer = true;
        using element_type = U;

        static const U*     get(const std::optional<U>& ptr)    { return ptr ? &*ptr : nullptr; }
        static void         assign(std::optional<U>& ptr, U&& value) { ptr = std::move(value); }
    };

    template<typename U>
    struct PointerTraits<std::unique_ptr<U>> {
        static constexpr bool is_pointer = true;
        using element_type = U;

        static const U*     get(const std::unique_ptr<U>& ptr)  { return ptr.get(); }
        static void         assign(std::unique_ptr<U>& ptr, U&& value) {
            if (ptr) {
                *ptr = std::move(value);
            } else {
                ptr = std::make_unique<U>(std::move(value));
            }
        }
    };

    template<typename T>
    constexpr ColumnKind builtinKind() {
        if constexpr (std::is_same_v<T, bool>)               return ColumnKind::BOOL;
        else if constexpr (std::is_integral_v<T>)            return integerKind<T>();
        else if constexpr (std::is_same_v<T, float>)         return ColumnKind::FLOAT;
        else if constexpr (std::is_same_v<T, double>)        return ColumnKind::DOUBLE;
        else if constexpr (std::is_same_v<T, std::string>)   return ColumnKind::STRING;
        else                                                 return ColumnKind::UNSUPPORTED;
    }

    class ValueRef {
        const void*             ptr_  = nullptr;
        std::type_index         type_ = typeid(void);
        ColumnKind              kind_ = ColumnKind::UNSUPPORTED;

    public:
        ValueRef() = default;

        template<typename T>
        static ValueRef of(const T& value) {
            if constexpr (PointerTraits<T>::is_pointer) {
                const auto* pointee = PointerTraits<T>::get(value);
                if (pointee == nullptr) {
                    return ValueRef{};
                }
                return of(*pointee);
            } else {
                ValueRef ref;
                ref.ptr_  = &value;
                ref.type_ = typeid(T);
                ref.kind_ = builtinKind<T>();
                return ref;
            }
        }

        bool                    empty() const                   { return ptr_ == nullptr; }
        ColumnKind              kind() const                    { return kind_; }
        std::type_index         type() const                    { return type_; }

        template<typename T>
        const T*                as() const {
            if (ptr_ == nullptr || type_ != std::type_index(typeid(T))) {
                return nullptr;
            }
            return static_cast<const T*>(ptr_);
        }
    };

} // namespace csvbind
