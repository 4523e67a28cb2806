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
 * @file schema.h
 * @brief Schema resolver - turns the declared fields of a record type into an
 *        ordered column schema.
 *
 * A record type declares its columns either through a static member
 *
 *     static void declareColumns(csvbind::Declaration<T>& d);
 *
 * or, for types that cannot be touched, through a specialization
 *
 *     template<> struct csvbind::Record<T> {
 *         static void declare(csvbind::Declaration<T>& d);
 *     };
 *
 * Declared fields are kept in an arena of SchemaNode objects linked by parent
 * index. Fixed inline groups (a nested record type) are expanded eagerly,
 * dynamic inline groups (InlineColumns<V>) stay a single placeholder column
 * until live data decides their width.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <typeindex>
#include <vector>

#include "codec.h"
#include "definitions.h"
#include "errors.h"
#include "inline_column.h"
#include "tag.h"

namespace csvbind {

    template<typename T> class Declaration;

    // Specialize to declare the columns of a type without touching it
    template<typename T>
    struct Record {};

    template<typename T>
    concept RecordType = std::is_class_v<T> && std::is_default_constructible_v<T> && (
        requires(Declaration<T>& d) { Record<T>::declare(d); } ||
        requires(Declaration<T>& d) { T::declareColumns(d); });

    enum class InlineKind : uint8_t {
        NONE,
        FIXED,
        DYNAMIC
    };

    /**
     * @brief Type-erased description of one declared field.
     */
    struct FieldDescriptor {
        std::string                                     name;           // member name
        std::string                                     tag;
        bool                                            isPrivate = false;
        InlineKind                                      shape = InlineKind::NONE;   // what the member can expand into
        ValueCodec                                      codec;          // codec of the member type
        std::function<void*(void*)>                     access;
        std::function<const void*(const void*)>         caccess;
        std::function<std::vector<FieldDescriptor>()>   nested;         // FIXED: fields of the nested record
        DynamicGroupOps                                 dynamic;        // DYNAMIC: group element access
        ValueCodec                                      elementCodec;   // DYNAMIC: codec of the group values
    };

    template<typename T>
    class Declaration {
        std::vector<FieldDescriptor>    fields_;

    public:
        template<typename M>
        Declaration&            field(std::string name, std::string tag, M T::* member);
        template<typename M>
        Declaration&            field(std::string name, M T::* member);
        template<typename M>
        Declaration&            privateField(std::string name, std::string tag, M T::* member);

        const std::vector<FieldDescriptor>& fields() const      { return fields_; }
    };

    template<RecordType T>
    std::vector<FieldDescriptor> describeRecord();

    /**
     * @brief Arena node: a declared field reachable from the record root.
     */
    struct SchemaNode {
        std::string                             name;           // member name
        std::string                             key;            // column key, or group key for groups
        InlineKind                              kind = InlineKind::NONE;
        int                                     parent = -1;    // enclosing group, -1 at top level
        std::vector<int>                        children;
        std::vector<int>                        path;           // nodes from the record root down to this one
        std::function<void*(void*)>             access;         // from the parent object
        std::function<const void*(const void*)> caccess;
        DynamicGroupOps                         dynamic;
    };

    /**
     * @brief One entry of the flattened column schema.
     */
    struct ColumnSchema {
        std::string             key;
        std::string             parentKey;          // key of the enclosing inline group
        std::string             prefix;             // DYNAMIC: prefix of the expanded column keys
        std::string             typeName;
        bool                    optional  = false;
        bool                    omitEmpty = false;
        InlineKind              inlineKind = InlineKind::NONE;  // FIXED for group members, DYNAMIC for placeholders
        ValueCodec              codec;              // DYNAMIC: codec of the group values
        int                     node = -1;          // arena node holding the value (the group for DYNAMIC)
    };

    struct ColumnDetail {
        std::string             name;
        bool                    optional  = false;
        bool                    omitEmpty = false;
        bool                    inlined   = false;
        std::string             typeName;
    };

    class Schema {
        std::vector<SchemaNode>     nodes_;
        std::vector<ColumnSchema>   columns_;
        std::type_index             record_type_ = typeid(void);
        std::string                 record_name_;
        bool                        has_dynamic_ = false;

    public:
        template<RecordType T>
        static Error            build(Schema& out);

        const std::vector<ColumnSchema>& columns() const        { return columns_; }
        bool                    hasDynamicGroups() const        { return has_dynamic_; }
        const SchemaNode&       node(int index) const           { return nodes_.at(static_cast<size_t>(index)); }
        const std::vector<SchemaNode>& nodes() const            { return nodes_; }
        const std::string&      recordName() const              { return record_name_; }
        std::type_index         recordType() const              { return record_type_; }

        void*                   resolve(void* record, int node) const;
        const void*             resolve(const void* record, int node) const;

    private:
        Error                   expand(const std::vector<FieldDescriptor>& fields, int parent,
                                       const std::string& prefix, const std::string& parentKey);
        Error                   validateKeys() const;
    };

    template<RecordType T>
    std::vector<ColumnDetail> getHeaderDetails();

    template<RecordType T>
    std::vector<std::string> getHeader();

} // namespace csvbind
