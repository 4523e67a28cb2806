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
 * @file csv_writer.h
 * @brief CsvRowWriter - RFC 4180 record writer over a text stream.
 *
 * Design:
 *   - A field is quoted when it contains the delimiter, a quote, \r or \n,
 *     when it starts with a space or tab, or when it is exactly "\."
 *   - Quotes inside quoted fields are doubled
 *   - Single stream write per row (buffered in a reusable string)
 *   - Records end with \n, or \r\n when useCrlf is set
 *
 * Usage:
 *     std::ostringstream out;
 *     csvbind::CsvRowWriter writer(out);
 *     writer.writeRow({"name", "age"});
 *     writer.writeRow({"Smith, J", "42"});
 *     writer.flush();
 */

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"
#include "row_source.h"

namespace csvbind {

    class CsvRowWriter : public RowSink {
        std::string             err_msg_;           // last error message description
        std::ostream&           stream_;            // text output stream
        size_t                  row_cnt_ = 0;       // total rows written

        char                    delimiter_ = ',';   // field delimiter
        bool                    use_crlf_ = false;  // terminate records with \r\n

        std::string             buf_;               // reusable per-row serialization buffer

    public:
        explicit CsvRowWriter(std::ostream& stream, char delimiter = ',', bool useCrlf = false);

        char                    delimiter() const               { return delimiter_; }
        bool                    flush() override;
        const std::string&      getErrorMsg() const             { return err_msg_; }
        size_t                  rowCount() const                { return row_cnt_; }
        bool                    writeRow(const std::vector<std::string>& fields) override;

        bool                    fieldNeedsQuotes(std::string_view field) const;

    private:
        void                    appendField(std::string_view field);
    };

} // namespace csvbind
