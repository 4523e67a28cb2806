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
 * @file csv_reader.h
 * @brief CsvRowReader - RFC 4180 record splitter over a text stream.
 *
 * Design:
 *   - Quoted fields may contain delimiters, doubled quotes and line breaks
 *   - A UTF-8 BOM on the first line and trailing \r are stripped
 *   - Empty lines are skipped
 *   - The first record fixes the field count (see setFieldsPerRecord())
 *   - The start line of every record is tracked for error reports
 *
 * Usage:
 *     std::ifstream input("people.csv");
 *     csvbind::CsvRowReader reader(input);
 *     std::vector<std::string> fields;
 *     while (reader.readRow(fields) == csvbind::ReadStatus::OK) {
 *         ...
 *     }
 */

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "definitions.h"
#include "row_source.h"

namespace csvbind {

    class CsvRowReader : public RowSource {
        std::string             err_msg_;           // last error message description
        std::istream&           stream_;            // text input stream

        int64_t                 fields_per_record_ = 0;     // 0: fixed by the first record, <0: unchecked
        int64_t                 file_line_ = 0;     // 1-based raw line counter
        int64_t                 row_line_ = LINE_UNKNOWN;   // start line of the last record
        size_t                  row_cnt_ = 0;       // records returned

        char                    delimiter_ = ',';   // field delimiter

        std::string             line_buf_;          // current raw line

    public:
        explicit CsvRowReader(std::istream& stream, char delimiter = ',');

        char                    delimiter() const               { return delimiter_; }
        int64_t                 fieldsPerRecord() const         { return fields_per_record_; }
        int64_t                 fileLine() const                { return file_line_; }
        const std::string&      getErrorMsg() const             { return err_msg_; }
        ReadStatus              readRow(std::vector<std::string>& fields) override;
        size_t                  rowCount() const                { return row_cnt_; }
        void                    setFieldsPerRecord(int64_t count) { fields_per_record_ = count; }
        int64_t                 sourceLine() const override     { return row_line_; }

    private:
        bool                    nextLine();
        ReadStatus              splitRecord(std::vector<std::string>& fields);
    };

} // namespace csvbind
