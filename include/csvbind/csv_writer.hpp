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
 * @file csv_writer.hpp
 * @brief CsvRowWriter implementations.
 */

#include "csv_writer.h"

#include <iostream>

namespace csvbind {

    inline CsvRowWriter::CsvRowWriter(std::ostream& stream, char delimiter, bool useCrlf)
        : stream_(stream)
        , delimiter_(delimiter)
        , use_crlf_(useCrlf)
    {
        buf_.reserve(1024);
    }

    inline bool CsvRowWriter::writeRow(const std::vector<std::string>& fields) {
        buf_.clear();
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) {
                buf_.push_back(delimiter_);
            }
            appendField(fields[i]);
        }
        if (use_crlf_) {
            buf_.push_back('\r');
        }
        buf_.push_back('\n');

        stream_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        if (!stream_) {
            err_msg_ = "Error: failed to write row " + std::to_string(row_cnt_ + 1);
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }
        row_cnt_++;
        return true;
    }

    inline bool CsvRowWriter::flush() {
        stream_.flush();
        if (!stream_) {
            err_msg_ = "Error: failed to flush output stream";
            return false;
        }
        return true;
    }

    inline bool CsvRowWriter::fieldNeedsQuotes(std::string_view field) const {
        if (field.empty()) {
            return false;
        }
        if (field == "\\.") {
            return true;
        }
        for (char c : field) {
            if (c == delimiter_ || c == '"' || c == '\r' || c == '\n') {
                return true;
            }
        }
        return field.front() == ' ' || field.front() == '\t';
    }

    inline void CsvRowWriter::appendField(std::string_view field) {
        if (!fieldNeedsQuotes(field)) {
            buf_.append(field);
            return;
        }
        buf_.push_back('"');
        for (char c : field) {
            if (c == '"') buf_.push_back('"'); // escape quotes by doubling
            buf_.push_back(c);
        }
        buf_.push_back('"');
    }

} // namespace csvbind
