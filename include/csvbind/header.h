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
 * @file header.h
 * @brief Header reconciler - matches a column schema against a live header
 *        (decode) or derives the header to emit (encode).
 *
 * Decode: every live column maps onto one planned column. Dynamic inline
 * groups are widened by positional scanning, so they only work with a header,
 * strict column order, no unrecognized columns and no localized header.
 *
 * Encode: the schema is flattened, dynamic groups take their width from the
 * header list of the first row.
 */

#include <string>
#include <vector>

#include "errors.h"
#include "schema.h"

namespace csvbind {

    struct ReconcileOptions {
        bool                    noHeaderMode = false;
        bool                    requireColumnOrder = true;
        bool                    allowUnrecognizedColumns = false;
        bool                    parseLocalizedHeader = false;
    };

    struct PlannedColumn {
        int                     schemaIndex = -1;   // -1 for unrecognized columns
        std::string             header;             // header text as found in the input
        bool                    unrecognized = false;
        int                     dynamicSlot = -1;   // position inside a dynamic group
    };

    struct DecodePlan {
        std::vector<PlannedColumn>              columns;            // one per input column
        std::vector<std::string>                unrecognized;
        std::vector<std::string>                missingOptional;
        std::vector<std::vector<std::string>>   dynamicHeaders;     // per schema column, prefix stripped
    };

    struct EncodeColumn {
        int                     schemaIndex = -1;
        std::string             key;
        std::string             parentKey;
        std::string             header;             // text written to the header row
        int                     dynamicSlot = -1;
    };

    // Blank, padded or repeated names
    Error validateHeader(const std::vector<std::string>& header);

    /**
     * @brief Reconcile a schema with the live header of the input.
     * @param displayHeaders  expected header text per schema column (key or localized key)
     * @param liveHeader      header row of the input, empty in headerless mode
     */
    Error reconcileDecodeHeader(const Schema& schema,
                                const std::vector<std::string>& displayHeaders,
                                const std::vector<std::string>& liveHeader,
                                const ReconcileOptions& options,
                                DecodePlan& plan);

    /**
     * @brief Flatten a schema into output columns.
     * @param dynamicHeaders  per schema column, the group header of the first row
     */
    void expandEncodeColumns(const Schema& schema,
                             const std::vector<std::vector<std::string>>& dynamicHeaders,
                             std::vector<EncodeColumn>& columns);

    // Like validateHeader, repeated names of dynamic columns are tolerated
    Error validateEncodeHeader(const std::vector<EncodeColumn>& columns);

} // namespace csvbind
