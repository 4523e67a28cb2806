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
 * @file schema.hpp
 * @brief Schema resolver implementations.
 */

#include "schema.h"
#include "codec.hpp"
#include "tag.hpp"

#include <cctype>
#include <iostream>
#include <unordered_set>

namespace csvbind {

    namespace detail {

        template<typename T, typename M>
        FieldDescriptor describeField(std::string name, std::string tag, bool isPrivate, M T::* member) {
            FieldDescriptor field;
            field.name      = std::move(name);
            field.tag       = std::move(tag);
            field.isPrivate = isPrivate;
            field.codec     = ValueCodec::of<M>();
            field.access    = [member](void* object) -> void* {
                return &(static_cast<T*>(object)->*member);
            };
            field.caccess   = [member](const void* object) -> const void* {
                return &(static_cast<const T*>(object)->*member);
            };
            if constexpr (IsInlineColumns<M>::value) {
                field.shape        = InlineKind::DYNAMIC;
                field.dynamic      = DynamicGroupOps::of<M>();
                field.elementCodec = ValueCodec::of<typename M::value_type>();
            } else if constexpr (RecordType<M>) {
                field.shape  = InlineKind::FIXED;
                field.nested = [] { return describeRecord<M>(); };
            }
            return field;
        }

    } // namespace detail

    template<typename T>
    template<typename M>
    Declaration<T>& Declaration<T>::field(std::string name, std::string tag, M T::* member) {
        fields_.push_back(detail::describeField(std::move(name), std::move(tag), false, member));
        return *this;
    }

    template<typename T>
    template<typename M>
    Declaration<T>& Declaration<T>::field(std::string name, M T::* member) {
        return field(std::move(name), std::string{}, member);
    }

    // A private member is only accepted when its tag ignores it
    template<typename T>
    template<typename M>
    Declaration<T>& Declaration<T>::privateField(std::string name, std::string tag, M T::* member) {
        fields_.push_back(detail::describeField(std::move(name), std::move(tag), true, member));
        return *this;
    }

    template<RecordType T>
    std::vector<FieldDescriptor> describeRecord() {
        Declaration<T> declaration;
        if constexpr (requires(Declaration<T>& d) { Record<T>::declare(d); }) {
            Record<T>::declare(declaration);
        } else {
            T::declareColumns(declaration);
        }
        return declaration.fields();
    }

    // ========================================================================
    // Schema
    // ========================================================================

    template<RecordType T>
    Error Schema::build(Schema& out) {
        out = Schema{};
        out.record_type_ = typeid(T);
        out.record_name_ = typeid(T).name();
        if (Error err = out.expand(describeRecord<T>(), -1, std::string{}, std::string{})) {
            return err;
        }
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "csvbind::Schema::build: " << out.columns_.size() << " columns, "
                      << out.nodes_.size() << " nodes" << std::endl;
        }
        return out.validateKeys();
    }

    inline Error Schema::expand(const std::vector<FieldDescriptor>& fields, int parent,
                                const std::string& prefix, const std::string& parentKey) {
        for (const FieldDescriptor& field : fields) {
            ColumnTag tag;
            if (Error err = parseTag(field.name, field.tag, field.isPrivate, tag)) {
                return err;
            }
            if (tag.ignored) {
                continue;
            }

            const int index = static_cast<int>(nodes_.size());
            SchemaNode node;
            node.name    = field.name;
            node.key     = prefix + tag.name;
            node.parent  = parent;
            node.access  = field.access;
            node.caccess = field.caccess;
            if (parent >= 0) {
                node.path = nodes_[static_cast<size_t>(parent)].path;
                nodes_[static_cast<size_t>(parent)].children.push_back(index);
            }
            node.path.push_back(index);

            if (!tag.inlined) {
                ColumnSchema column;
                column.key        = node.key;
                column.parentKey  = parentKey;
                column.typeName   = field.codec.typeName;
                column.optional   = tag.optional;
                column.omitEmpty  = tag.omitEmpty;
                column.inlineKind = parent >= 0 ? InlineKind::FIXED : InlineKind::NONE;
                column.codec      = field.codec;
                column.node       = index;
                nodes_.push_back(std::move(node));
                columns_.push_back(std::move(column));
                continue;
            }

            const std::string childPrefix = prefix + tag.prefix;
            switch (field.shape) {
            case InlineKind::FIXED: {
                node.kind = InlineKind::FIXED;
                const std::string groupKey = node.key;
                nodes_.push_back(std::move(node));
                const size_t before = columns_.size();
                if (Error err = expand(field.nested(), index, childPrefix, groupKey)) {
                    return err;
                }
                if (columns_.size() == before) {
                    return Error(Errc::HeaderDynamicTypeInvalid, "inline column " + field.name + " has no columns");
                }
                break;
            }
            case InlineKind::DYNAMIC: {
                node.kind    = InlineKind::DYNAMIC;
                node.dynamic = field.dynamic;
                ColumnSchema column;
                column.key        = childPrefix + tag.name;
                column.parentKey  = node.key;
                column.prefix     = childPrefix;
                column.typeName   = field.elementCodec.typeName;
                column.omitEmpty  = tag.omitEmpty;
                column.inlineKind = InlineKind::DYNAMIC;
                column.codec      = field.elementCodec;
                column.node       = index;
                nodes_.push_back(std::move(node));
                columns_.push_back(std::move(column));
                has_dynamic_ = true;
                break;
            }
            case InlineKind::NONE:
                return Error(Errc::HeaderDynamicTypeInvalid,
                             "inline column " + field.name + " must be a record or InlineColumns type");
            }
        }
        return {};
    }

    inline Error Schema::validateKeys() const {
        std::unordered_set<std::string> seen;
        for (const ColumnSchema& column : columns_) {
            const std::string& key = column.key;
            if (key.empty() || std::isspace(static_cast<unsigned char>(key.front())) ||
                std::isspace(static_cast<unsigned char>(key.back()))) {
                return Error(Errc::HeaderColumnInvalid, "\"" + key + "\"");
            }
            if (column.inlineKind == InlineKind::DYNAMIC) {
                continue;
            }
            if (!seen.insert(key).second) {
                return Error(Errc::HeaderColumnDuplicated, key);
            }
        }
        return {};
    }

    inline void* Schema::resolve(void* record, int node) const {
        void* current = record;
        for (int step : nodes_.at(static_cast<size_t>(node)).path) {
            current = nodes_[static_cast<size_t>(step)].access(current);
        }
        return current;
    }

    inline const void* Schema::resolve(const void* record, int node) const {
        const void* current = record;
        for (int step : nodes_.at(static_cast<size_t>(node)).path) {
            current = nodes_[static_cast<size_t>(step)].caccess(current);
        }
        return current;
    }

    // ── Header queries ──────────────────────────────────────────────────

    // Top level fields only, fields with an invalid tag are skipped
    template<RecordType T>
    std::vector<ColumnDetail> getHeaderDetails() {
        std::vector<ColumnDetail> details;
        for (const FieldDescriptor& field : describeRecord<T>()) {
            ColumnTag tag;
            if (parseTag(field.name, field.tag, field.isPrivate, tag) || tag.ignored) {
                continue;
            }
            ColumnDetail detail;
            detail.name      = tag.name;
            detail.optional  = tag.optional;
            detail.omitEmpty = tag.omitEmpty;
            detail.inlined   = tag.inlined;
            detail.typeName  = field.codec.typeName;
            details.push_back(std::move(detail));
        }
        return details;
    }

    template<RecordType T>
    std::vector<std::string> getHeader() {
        std::vector<std::string> header;
        for (ColumnDetail& detail : getHeaderDetails<T>()) {
            header.push_back(std::move(detail.name));
        }
        return header;
    }

} // namespace csvbind
