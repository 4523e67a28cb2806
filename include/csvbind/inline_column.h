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
 * @file inline_column.h
 * @brief InlineColumns - a variable-width group of homogeneous columns.
 *
 * Declared with the "inline" tag option, the group expands into one column per
 * entry of header. When decoding, header is filled from the live header (the
 * group prefix stripped) and values holds one decoded value per column. When
 * encoding, the first row decides the group's columns.
 *
 *     struct Sample {
 *         std::string                name;
 *         csvbind::InlineColumns<int> scores;
 *
 *         static void declareColumns(csvbind::Declaration<Sample>& d) {
 *             d.field("name", "name", &Sample::name)
 *              .field("scores", "scores,inline,prefix=s_", &Sample::scores);
 *         }
 *     };
 */

#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace csvbind {

    template<typename V>
    struct InlineColumns {
        static_assert(!std::is_same_v<V, bool>, "InlineColumns<bool> has no addressable values, use InlineColumns<char>");
        using value_type = V;

        std::vector<std::string>    header;
        std::vector<V>              values;

        bool operator==(const InlineColumns&) const = default;
    };

    template<typename T>
    struct IsInlineColumns : std::false_type {};

    template<typename V>
    struct IsInlineColumns<InlineColumns<V>> : std::true_type {};

    /**
     * @brief Element access of a dynamic group, erased for the schema arena.
     */
    struct DynamicGroupOps {
        std::vector<std::string>&       (*header)(void* group) = nullptr;
        const std::vector<std::string>& (*cheader)(const void* group) = nullptr;
        void                            (*resize)(void* group, size_t count) = nullptr;
        size_t                          (*size)(const void* group) = nullptr;
        void*                           (*value)(void* group, size_t index) = nullptr;
        const void*                     (*cvalue)(const void* group, size_t index) = nullptr;

        template<typename G>
        static DynamicGroupOps of() {
            DynamicGroupOps ops;
            ops.header  = [](void* g) -> std::vector<std::string>& { return static_cast<G*>(g)->header; };
            ops.cheader = [](const void* g) -> const std::vector<std::string>& { return static_cast<const G*>(g)->header; };
            ops.resize  = [](void* g, size_t n) {
                static_cast<G*>(g)->values.clear();
                static_cast<G*>(g)->values.resize(n);
            };
            ops.size    = [](const void* g) { return static_cast<const G*>(g)->values.size(); };
            ops.value   = [](void* g, size_t i) -> void* { return &static_cast<G*>(g)->values[i]; };
            ops.cvalue  = [](const void* g, size_t i) -> const void* { return &static_cast<const G*>(g)->values[i]; };
            return ops;
        }
    };

} // namespace csvbind
