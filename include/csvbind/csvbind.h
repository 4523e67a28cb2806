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
 * @file csvbind.h
 * @brief CSV record binding (CSVBIND) Library - Main Header with Declarations
 *
 * A C++20 header-only library mapping CSV rows onto C++ record types and back,
 * with header reconciliation, per-column processing and validation, and
 * cell/row/document level error reporting.
 *
 * This header includes all CSVBIND component declarations:
 * - Schema:        column layout derived from a record declaration
 * - Header:        reconciliation of a live header with the schema
 * - ValueCodec:    per-type text codecs
 * - Decoder:       rows to records
 * - Encoder:       records to rows
 * - Errors:        CellError / RowErrors / Errors
 * - Renderers:     SimpleRenderer, CsvRenderer
 * - CsvRowReader / CsvRowWriter: RFC 4180 adapters over iostreams
 */

#include <string>
#include <string_view>
#include <vector>

// Core definitions first
#include "definitions.h"

// Core component declarations
#include "errors.h"
#include "value_ref.h"
#include "codec.h"
#include "tag.h"
#include "inline_column.h"
#include "schema.h"
#include "header.h"
#include "row_source.h"
#include "csv_reader.h"
#include "csv_writer.h"
#include "processors.h"
#include "validator.h"
#include "decoder.h"
#include "encoder.h"
#include "render.h"

namespace csvbind {

    /**
     * @brief Decode CSV text into records.
     * @return true when no data error occurred; @p errors receives every collected error.
     * @throws Exception on schema, header or configuration failures.
     */
    template<RecordType T>
    bool unmarshal(std::string_view csv, std::vector<T>& out, Errors& errors, const DecodeConfig& config = {});

    /**
     * @brief Encode records as CSV text.
     * @throws Exception on schema, configuration or encoding failures.
     */
    template<RecordType T>
    std::string marshal(const std::vector<T>& rows, const EncodeConfig& config = {});

} // namespace csvbind

// Include implementations
#include "csvbind.hpp"
#include "errors.hpp"
#include "codec.hpp"
#include "tag.hpp"
#include "schema.hpp"
#include "header.hpp"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "render.hpp"
