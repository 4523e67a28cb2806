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
 * @file csv_reader.hpp
 * @brief CsvRowReader implementations.
 */

#include "csv_reader.h"

#include <iostream>
#include <string_view>

namespace csvbind {

    inline CsvRowReader::CsvRowReader(std::istream& stream, char delimiter)
        : stream_(stream)
        , delimiter_(delimiter)
    {
        line_buf_.reserve(4096);
    }

    // ── Reading ─────────────────────────────────────────────────────────

    inline ReadStatus CsvRowReader::readRow(std::vector<std::string>& fields) {
        fields.clear();
        err_msg_.clear();

        // Skip empty lines
        do {
            if (!nextLine()) {
                if (stream_.bad()) {
                    err_msg_ = "Error: input stream failed after line " + std::to_string(file_line_);
                    if constexpr (DEBUG_OUTPUTS) {
                        std::cerr << err_msg_ << std::endl;
                    }
                }
                return ReadStatus::END;
            }
        } while (line_buf_.empty());

        row_line_ = file_line_;
        ReadStatus status = splitRecord(fields);
        if (status == ReadStatus::QUOTE) {
            fields.clear();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return status;
        }

        row_cnt_++;
        if (fields_per_record_ == 0) {
            fields_per_record_ = static_cast<int64_t>(fields.size());
        } else if (fields_per_record_ > 0 && static_cast<int64_t>(fields.size()) != fields_per_record_) {
            err_msg_ = "Warning: record on line " + std::to_string(row_line_) + " has " +
                       std::to_string(fields.size()) + " fields, expected " + std::to_string(fields_per_record_);
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return ReadStatus::FIELD_COUNT;
        }
        return ReadStatus::OK;
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Read one raw line, stripping a leading BOM and trailing \r
    inline bool CsvRowReader::nextLine() {
        if (!std::getline(stream_, line_buf_)) {
            return false;
        }
        file_line_++;

        // Strip BOM if present (UTF-8 BOM: EF BB BF)
        if (file_line_ == 1 && line_buf_.size() >= 3 &&
            static_cast<unsigned char>(line_buf_[0]) == 0xEF &&
            static_cast<unsigned char>(line_buf_[1]) == 0xBB &&
            static_cast<unsigned char>(line_buf_[2]) == 0xBF) {
            line_buf_.erase(0, 3);
        }

        // Strip trailing \r for Windows line endings
        if (!line_buf_.empty() && line_buf_.back() == '\r') {
            line_buf_.pop_back();
        }
        return true;
    }

    /// Split the record starting in line_buf_, pulling more lines for quoted line breaks
    inline ReadStatus CsvRowReader::splitRecord(std::vector<std::string>& fields) {
        size_t pos = 0;
        std::string field;

        while (true) {
            if (pos < line_buf_.size() && line_buf_[pos] == '"') {
                // Quoted field
                field.clear();
                ++pos;
                while (true) {
                    if (pos >= line_buf_.size()) {
                        if (!nextLine()) {
                            err_msg_ = "Error: unterminated quoted field starting on line " + std::to_string(row_line_);
                            return ReadStatus::QUOTE;
                        }
                        field.push_back('\n');
                        pos = 0;
                        continue;
                    }
                    char c = line_buf_[pos];
                    if (c == '"') {
                        if (pos + 1 < line_buf_.size() && line_buf_[pos + 1] == '"') {
                            field.push_back('"');
                            pos += 2;
                            continue;
                        }
                        ++pos;
                        break;
                    }
                    field.push_back(c);
                    ++pos;
                }

                fields.push_back(field);
                if (pos == line_buf_.size()) {
                    return ReadStatus::OK;
                }
                if (line_buf_[pos] != delimiter_) {
                    err_msg_ = "Error: extraneous \" in field on line " + std::to_string(file_line_);
                    return ReadStatus::QUOTE;
                }
                ++pos;
            } else {
                // Plain field
                size_t end = line_buf_.find(delimiter_, pos);
                std::string_view raw = std::string_view(line_buf_).substr(pos, end == std::string::npos ? std::string::npos : end - pos);
                if (raw.find('"') != std::string_view::npos) {
                    err_msg_ = "Error: bare \" in non-quoted field on line " + std::to_string(file_line_);
                    return ReadStatus::QUOTE;
                }
                fields.emplace_back(raw);
                if (end == std::string::npos) {
                    return ReadStatus::OK;
                }
                pos = end + 1;
            }
        }
    }

} // namespace csvbind
