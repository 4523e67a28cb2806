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
 * @file encoder.hpp
 * @brief Encoder implementations.
 */

#include "encoder.h"
#include "header.hpp"
#include "schema.hpp"

#include <algorithm>
#include <iostream>

namespace csvbind {

    inline Encoder::Encoder(RowSink& sink, EncodeConfig config)
        : sink_(sink)
        , config_(std::move(config))
    {
    }

    // ── Public API ──────────────────────────────────────────────────────

    template<RecordType T>
    void Encoder::encode(const std::vector<T>& rows) {
        begin<T>(rows.empty() ? nullptr : &rows.front());
        for (const T& row : rows) {
            if (Error err = encodeRow(&row)) {
                fail(std::move(err));
            }
        }
    }

    // Null rows are skipped, dynamic group widths come from the first non-null row
    template<RecordType T>
    void Encoder::encode(const std::vector<T*>& rows) {
        auto first = std::find_if(rows.begin(), rows.end(), [](const T* row) { return row != nullptr; });
        begin<T>(first == rows.end() ? nullptr : *first);
        for (const T* row : rows) {
            if (row == nullptr) {
                continue;
            }
            if (Error err = encodeRow(row)) {
                fail(std::move(err));
            }
        }
    }

    template<RecordType T>
    void Encoder::encodeOne(const T& row) {
        begin<T>(&row);
        if (Error err = encodeRow(&row)) {
            fail(std::move(err));
        }
    }

    template<RecordType T>
    void Encoder::encodeOne(const T* row) {
        if (row == nullptr) {
            throw Exception(Error(Errc::ValueNil, "must be a non-null pointer"));
        }
        encodeOne(*row);
    }

    inline void Encoder::finish() {
        const bool failed = state_ == State::FAILED;
        state_ = State::FINISHED;
        if (!failed && !sink_.flush()) {
            throw Exception(Error(Errc::Unexpected, "failed to flush output"));
        }
    }

    // ── Session setup ───────────────────────────────────────────────────

    template<RecordType T>
    void Encoder::begin(const T* firstRow) {
        if (state_ == State::FINISHED) {
            throw Exception(Error(Errc::Finished));
        }
        if (state_ == State::FAILED) {
            throw Exception(Error(Errc::AlreadyFailed));
        }
        if (state_ != State::FRESH) {
            if (schema_.recordType() != std::type_index(typeid(T))) {
                throw Exception(Error(Errc::TypeUnmatched,
                                      std::string(typeid(T).name()) + " (expect " + schema_.recordName() + ")"));
            }
            return;
        }

        if (Error err = prepare<T>(firstRow)) {
            fail(std::move(err));
        }
        state_ = State::STREAMING;
    }

    template<RecordType T>
    Error Encoder::prepare(const T* firstRow) {
        if (config_.localizeHeader && !config_.localizationFunc) {
            return Error(Errc::ConfigOptionInvalid, "localization function required");
        }
        if (Error err = Schema::build<T>(schema_)) {
            return err;
        }

        // Dynamic groups are as wide as in the first row
        const std::vector<ColumnSchema>& columns = schema_.columns();
        std::vector<std::vector<std::string>> dynamicHeaders(columns.size());
        if (firstRow != nullptr) {
            for (size_t i = 0; i < columns.size(); ++i) {
                if (columns[i].inlineKind != InlineKind::DYNAMIC) {
                    continue;
                }
                const SchemaNode& node = schema_.node(columns[i].node);
                dynamicHeaders[i] = node.dynamic.cheader(schema_.resolve(firstRow, columns[i].node));
            }
        }

        std::vector<EncodeColumn> expanded;
        expandEncodeColumns(schema_, dynamicHeaders, expanded);
        return planColumns(expanded);
    }

    inline Error Encoder::planColumns(const std::vector<EncodeColumn>& expanded) {
        const std::vector<ColumnSchema>& columns = schema_.columns();

        for (const auto& [key, columnConfig] : config_.columnConfigs()) {
            bool known = std::any_of(columns.begin(), columns.end(), [&key](const ColumnSchema& column) {
                return column.key == key || column.parentKey == key;
            }) || std::any_of(expanded.begin(), expanded.end(), [&key](const EncodeColumn& column) {
                return column.key == key;
            });
            if (!known) {
                return Error(Errc::ConfigOptionInvalid, "column \"" + key + "\" not found");
            }
        }

        columns_.clear();
        cursors_.assign(schema_.nodes().size(), 0);
        std::vector<EncodeColumn> written;

        for (const EncodeColumn& encodeColumn : expanded) {
            const ColumnSchema& schemaColumn = columns[static_cast<size_t>(encodeColumn.schemaIndex)];
            const bool dynamic = schemaColumn.inlineKind == InlineKind::DYNAMIC;

            // A column override wins over the override of its inline group
            const EncodeColumnConfig* columnConfig = config_.findColumn(encodeColumn.key);
            if (columnConfig == nullptr && !encodeColumn.parentKey.empty()) {
                columnConfig = config_.findColumn(encodeColumn.parentKey);
            }

            ColumnPlan column;
            column.node        = schemaColumn.node;
            column.dynamicSlot = encodeColumn.dynamicSlot;
            column.header      = encodeColumn.header;
            column.omitEmpty   = schemaColumn.omitEmpty;
            column.config      = columnConfig;
            column.skip        = columnConfig != nullptr && columnConfig->skip;

            if (config_.localizeHeader) {
                std::optional<std::string> text = config_.localizationFunc(encodeColumn.key, ParameterMap{});
                if (text) {
                    column.header = std::move(*text);
                } else if (!dynamic) {
                    return Error(Errc::Localization, encodeColumn.key);
                }
            }

            if (!column.skip) {
                if (columnConfig != nullptr && columnConfig->hasEncodeFunc()) {
                    if (columnConfig->encodeType() != schemaColumn.codec.type) {
                        return Error(Errc::ConfigOptionInvalid,
                                     "encode function of column \"" + encodeColumn.key + "\" does not take " +
                                     schemaColumn.typeName);
                    }
                } else if (!schemaColumn.codec.canEncode()) {
                    return Error(Errc::TypeUnsupported, schemaColumn.typeName);
                } else {
                    column.encode = schemaColumn.codec.encode;
                }
                EncodeColumn headerColumn = encodeColumn;
                headerColumn.header = column.header;
                written.push_back(std::move(headerColumn));
            }
            columns_.push_back(std::move(column));
        }

        if (Error err = validateEncodeHeader(written)) {
            return err;
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "csvbind::Encoder: " << schema_.recordName() << " planned with "
                      << written.size() << " columns" << std::endl;
        }

        if (!config_.noHeaderMode) {
            std::vector<std::string> header;
            header.reserve(written.size());
            for (const EncodeColumn& column : written) {
                header.push_back(column.header);
            }
            if (!sink_.writeRow(header)) {
                return Error(Errc::Unexpected, "failed to write header");
            }
        }
        return {};
    }

    // ── Row processing ──────────────────────────────────────────────────

    inline Error Encoder::encodeRow(const void* record) {
        std::fill(cursors_.begin(), cursors_.end(), 0);
        record_.clear();

        for (const ColumnPlan& column : columns_) {
            const void* source = nullptr;
            if (column.dynamicSlot >= 0) {
                const SchemaNode& node = schema_.node(column.node);
                const void* group = schema_.resolve(record, column.node);
                const size_t index = static_cast<size_t>(cursors_[static_cast<size_t>(column.node)]++);
                if (column.skip) {
                    continue;
                }
                if (index >= node.dynamic.size(group)) {
                    return Error(Errc::EncodeValueType,
                                 "column \"" + column.header + "\" has no value in row " + std::to_string(row_cnt_ + 1));
                }
                source = node.dynamic.cvalue(group, index);
            } else {
                if (column.skip) {
                    continue;
                }
                source = schema_.resolve(record, column.node);
            }

            std::string text;
            Error err = column.encode != nullptr ? column.encode(source, column.omitEmpty, text)
                                                 : column.config->encodeFunc()(source, column.omitEmpty, text);
            if (err) {
                return err;
            }
            if (column.config != nullptr) {
                for (const ProcessorFunc& fn : column.config->postprocessors) {
                    text = fn(text);
                }
            }
            record_.push_back(std::move(text));
        }

        if (!sink_.writeRow(record_)) {
            return Error(Errc::Unexpected, "failed to write row " + std::to_string(row_cnt_ + 1));
        }
        row_cnt_++;
        return {};
    }

    inline void Encoder::fail(Error error) {
        state_ = State::FAILED;
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "csvbind::Encoder: " << error.message() << std::endl;
        }
        throw Exception(std::move(error));
    }

} // namespace csvbind
