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
 * @file row_source.h
 * @brief Row-level input and output boundaries of the decoder and encoder.
 *
 * A RowSource delivers one record at a time as a list of raw field texts, a
 * RowSink accepts one record at a time. CsvRowReader and CsvRowWriter adapt
 * text streams, MemoryRowSource and MemoryRowSink keep rows in memory.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "definitions.h"

namespace csvbind {

    enum class ReadStatus : uint8_t {
        OK,
        END,            // no more rows
        FIELD_COUNT,    // row delivered, but its field count differs from the first row
        QUOTE           // malformed quoting, row dropped
    };

    class RowSource {
    public:
        virtual ~RowSource() = default;

        virtual ReadStatus      readRow(std::vector<std::string>& fields) = 0;
        // Source line where the last returned row starts
        virtual int64_t         sourceLine() const              { return LINE_UNKNOWN; }
    };

    class RowSink {
    public:
        virtual ~RowSink() = default;

        virtual bool            writeRow(const std::vector<std::string>& fields) = 0;
        virtual bool            flush()                         { return true; }
    };

    /**
     * @brief Rows held in memory, every row reported as well formed.
     */
    class MemoryRowSource : public RowSource {
        std::vector<std::vector<std::string>> rows_;
        size_t                  pos_ = 0;

    public:
        MemoryRowSource() = default;
        explicit MemoryRowSource(std::vector<std::vector<std::string>> rows) : rows_(std::move(rows)) {}

        ReadStatus              readRow(std::vector<std::string>& fields) override {
            if (pos_ >= rows_.size()) {
                return ReadStatus::END;
            }
            fields = rows_[pos_++];
            return ReadStatus::OK;
        }
        int64_t                 sourceLine() const override     { return static_cast<int64_t>(pos_); }
    };

    class MemoryRowSink : public RowSink {
        std::vector<std::vector<std::string>> rows_;

    public:
        bool                    writeRow(const std::vector<std::string>& fields) override {
            rows_.push_back(fields);
            return true;
        }
        const std::vector<std::vector<std::string>>& rows() const { return rows_; }
    };

} // namespace csvbind
