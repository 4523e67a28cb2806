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
 * @file header.hpp
 * @brief Header reconciler implementations.
 */

#include "header.h"

#include <cctype>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace csvbind {

    namespace detail {

        inline bool isPadded(const std::string& text) {
            return text.empty() ||
                   std::isspace(static_cast<unsigned char>(text.front())) ||
                   std::isspace(static_cast<unsigned char>(text.back()));
        }

        inline std::string bracketList(const std::vector<std::string>& items) {
            std::string out = "[";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ' ';
                out += items[i];
            }
            out += ']';
            return out;
        }

        // Expected column of the reconciled input: a schema column, or one live column of a dynamic group
        struct ExpectedColumn {
            int                 schemaIndex = -1;
            std::string         header;
            int                 dynamicSlot = -1;
        };

        // Widen dynamic groups from the live header. A group takes every live column up to the
        // next header that a later schema column expects.
        inline Error scanDynamicGroups(const Schema& schema,
                                       const std::vector<std::string>& displayHeaders,
                                       const std::vector<std::string>& liveHeader,
                                       std::vector<ExpectedColumn>& expected,
                                       DecodePlan& plan) {
            const std::vector<ColumnSchema>& columns = schema.columns();
            size_t live = 0;
            for (size_t i = 0; i < columns.size(); ++i) {
                const ColumnSchema& column = columns[i];
                if (column.inlineKind != InlineKind::DYNAMIC) {
                    if (live < liveHeader.size() && liveHeader[live] == displayHeaders[i]) {
                        expected.push_back({static_cast<int>(i), displayHeaders[i], -1});
                        live++;
                        continue;
                    }
                    if (column.optional) {
                        expected.push_back({static_cast<int>(i), displayHeaders[i], -1});
                        continue;
                    }
                    return Error(Errc::HeaderDynamicNotAllowUnrecognizedColumns, "\"" + displayHeaders[i] + "\"");
                }

                std::unordered_set<std::string> later;
                for (size_t k = i + 1; k < columns.size(); ++k) {
                    if (columns[k].inlineKind != InlineKind::DYNAMIC) {
                        later.insert(displayHeaders[k]);
                    }
                }
                std::vector<std::string>& groupHeader = plan.dynamicHeaders[i];
                for (; live < liveHeader.size(); ++live) {
                    const std::string& text = liveHeader[live];
                    if (later.count(text) != 0) {
                        break;
                    }
                    const int slot = static_cast<int>(groupHeader.size());
                    expected.push_back({static_cast<int>(i), text, slot});
                    groupHeader.push_back(text.starts_with(column.prefix) ? text.substr(column.prefix.size()) : text);
                }
            }
            return {};
        }

    } // namespace detail

    inline Error validateHeader(const std::vector<std::string>& header) {
        std::unordered_set<std::string> seen;
        for (const std::string& text : header) {
            if (detail::isPadded(text)) {
                return Error(Errc::HeaderColumnInvalid, "\"" + text + "\" invalid");
            }
            if (!seen.insert(text).second) {
                return Error(Errc::HeaderColumnDuplicated, "\"" + text + "\" duplicated");
            }
        }
        return {};
    }

    inline Error reconcileDecodeHeader(const Schema& schema,
                                       const std::vector<std::string>& displayHeaders,
                                       const std::vector<std::string>& liveHeader,
                                       const ReconcileOptions& options,
                                       DecodePlan& plan) {
        const std::vector<ColumnSchema>& columns = schema.columns();
        plan = DecodePlan{};
        plan.dynamicHeaders.resize(columns.size());

        // Dynamic groups are shaped by positional scanning only
        if (schema.hasDynamicGroups()) {
            if (options.noHeaderMode || liveHeader.empty()) {
                return Error(Errc::HeaderDynamicNotAllowNoHeaderMode);
            }
            if (!options.requireColumnOrder) {
                return Error(Errc::HeaderDynamicRequireColumnOrder);
            }
            if (options.allowUnrecognizedColumns) {
                return Error(Errc::HeaderDynamicNotAllowUnrecognizedColumns);
            }
            if (options.parseLocalizedHeader) {
                return Error(Errc::HeaderDynamicNotAllowLocalizedHeader);
            }
        }

        // Expected header texts must be usable as lookup keys
        std::unordered_set<std::string> displaySeen;
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i].inlineKind == InlineKind::DYNAMIC) {
                continue;
            }
            if (detail::isPadded(displayHeaders[i])) {
                return Error(Errc::HeaderColumnInvalid, "\"" + displayHeaders[i] + "\" invalid");
            }
            if (!displaySeen.insert(displayHeaders[i]).second) {
                return Error(Errc::HeaderColumnDuplicated, "\"" + displayHeaders[i] + "\" duplicated");
            }
        }

        // Headerless input is taken in schema order
        if (options.noHeaderMode || liveHeader.empty()) {
            for (size_t i = 0; i < columns.size(); ++i) {
                plan.columns.push_back({static_cast<int>(i), displayHeaders[i], false, -1});
            }
            return {};
        }

        if (Error err = validateHeader(liveHeader)) {
            return err;
        }

        std::vector<detail::ExpectedColumn> expected;
        if (schema.hasDynamicGroups()) {
            if (Error err = detail::scanDynamicGroups(schema, displayHeaders, liveHeader, expected, plan)) {
                return err;
            }
        } else {
            for (size_t i = 0; i < columns.size(); ++i) {
                expected.push_back({static_cast<int>(i), displayHeaders[i], -1});
            }
        }

        std::unordered_map<std::string, size_t> byHeader;
        for (size_t i = 0; i < expected.size(); ++i) {
            byHeader.emplace(expected[i].header, i);
        }

        std::vector<bool> present(expected.size(), false);
        for (const std::string& text : liveHeader) {
            auto it = byHeader.find(text);
            if (it == byHeader.end()) {
                if (!options.allowUnrecognizedColumns) {
                    return Error(Errc::HeaderColumnUnrecognized, "\"" + text + "\"");
                }
                plan.columns.push_back({-1, text, true, -1});
                plan.unrecognized.push_back(text);
                continue;
            }
            const detail::ExpectedColumn& column = expected[it->second];
            present[it->second] = true;
            plan.columns.push_back({column.schemaIndex, column.header, false, column.dynamicSlot});
        }

        for (size_t i = 0; i < expected.size(); ++i) {
            if (present[i]) {
                continue;
            }
            if (!columns[static_cast<size_t>(expected[i].schemaIndex)].optional) {
                return Error(Errc::HeaderColumnRequired, "\"" + expected[i].header + "\"");
            }
            plan.missingOptional.push_back(expected[i].header);
        }

        if (options.requireColumnOrder) {
            std::vector<std::string> found;
            for (const PlannedColumn& column : plan.columns) {
                if (!column.unrecognized) found.push_back(column.header);
            }
            std::vector<std::string> wanted;
            for (size_t i = 0; i < expected.size(); ++i) {
                if (present[i]) wanted.push_back(expected[i].header);
            }
            if (found != wanted) {
                return Error(Errc::HeaderColumnOrderInvalid,
                             detail::bracketList(found) + " (expect " + detail::bracketList(wanted) + ")");
            }
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "csvbind::reconcileDecodeHeader: " << plan.columns.size() << " columns, "
                      << plan.unrecognized.size() << " unrecognized, "
                      << plan.missingOptional.size() << " missing optional" << std::endl;
        }
        return {};
    }

    inline void expandEncodeColumns(const Schema& schema,
                                    const std::vector<std::vector<std::string>>& dynamicHeaders,
                                    std::vector<EncodeColumn>& columns) {
        columns.clear();
        const std::vector<ColumnSchema>& schemaColumns = schema.columns();
        for (size_t i = 0; i < schemaColumns.size(); ++i) {
            const ColumnSchema& column = schemaColumns[i];
            if (column.inlineKind != InlineKind::DYNAMIC) {
                columns.push_back({static_cast<int>(i), column.key, column.parentKey, column.key, -1});
                continue;
            }
            if (i >= dynamicHeaders.size()) {
                continue;
            }
            int slot = 0;
            for (const std::string& name : dynamicHeaders[i]) {
                std::string key = column.prefix + name;
                columns.push_back({static_cast<int>(i), key, column.parentKey, key, slot++});
            }
        }
    }

    inline Error validateEncodeHeader(const std::vector<EncodeColumn>& columns) {
        std::unordered_set<std::string> seen;
        for (const EncodeColumn& column : columns) {
            if (detail::isPadded(column.header)) {
                return Error(Errc::HeaderColumnInvalid, "\"" + column.header + "\" invalid");
            }
            if (!seen.insert(column.header).second && column.dynamicSlot < 0) {
                return Error(Errc::HeaderColumnDuplicated, "\"" + column.header + "\" duplicated");
            }
        }
        return {};
    }

} // namespace csvbind
