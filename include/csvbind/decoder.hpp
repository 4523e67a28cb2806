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
 * @file decoder.hpp
 * @brief Decoder implementations.
 */

#include "decoder.h"
#include "header.hpp"
#include "processors.h"
#include "schema.hpp"

#include <algorithm>
#include <iostream>

namespace csvbind {

    inline Decoder::Decoder(RowSource& source, DecodeConfig config)
        : source_(source)
        , config_(std::move(config))
    {
    }

    // ── Public API ──────────────────────────────────────────────────────

    template<RecordType T>
    bool Decoder::decode(std::vector<T>& out) {
        begin<T>();
        state_ = State::STREAMING;

        std::vector<T> rows;
        bool stop = false;
        bool exhausted = false;
        while (!stop && !exhausted) {
            rows.reserve(rows.size() + config_.chunkSize);
            for (size_t n = 0; n < config_.chunkSize; ++n) {
                Fetch fetch = fetchRow();
                if (fetch == Fetch::END) {
                    exhausted = true;
                    break;
                }
                if (fetch == Fetch::FATAL) {
                    stop = true;
                    break;
                }

                T& record = rows.emplace_back();
                RowErrors rowErrors(row_, line_);
                bool halted = false;
                if (fetch == Fetch::ROW_ERROR) {
                    rowErrors.add(structural_);
                } else {
                    halted = decodeRow(&record, rowErrors);
                }
                if (rowErrors.hasError()) {
                    errors_.add(std::move(rowErrors));
                    if (config_.stopOnError || halted) {
                        stop = true;
                        break;
                    }
                }
            }
        }

        if (stop) {
            halt();
        } else {
            state_ = State::FINISHED;
            updateTotals();
        }
        if (errors_.hasError()) {
            return false;
        }
        out = std::move(rows);
        return true;
    }

    template<RecordType T>
    bool Decoder::decodeOne(T& out) {
        begin<T>();
        state_ = State::STREAMING;

        out = T{};
        last_row_errors_ = RowErrors{};
        Fetch fetch = fetchRow();
        if (fetch == Fetch::END) {
            state_ = State::FINISHED;
            updateTotals();
            return false;
        }
        if (fetch == Fetch::FATAL) {
            halt();
            return false;
        }

        last_row_errors_ = RowErrors(row_, line_);
        bool halted = false;
        if (fetch == Fetch::ROW_ERROR) {
            last_row_errors_.add(structural_);
        } else {
            halted = decodeRow(&out, last_row_errors_);
        }
        updateTotals();
        if (last_row_errors_.hasError()) {
            errors_.add(last_row_errors_);
            if (config_.stopOnError || halted) {
                halt();
                return false;
            }
        }
        return true;
    }

    template<RecordType T>
    bool Decoder::decodeOne(T* out) {
        if (out == nullptr) {
            throw Exception(Error(Errc::ValueNil, "must be a non-null pointer"));
        }
        return decodeOne(*out);
    }

    inline const DecodeResult& Decoder::finish() {
        state_ = State::FINISHED;
        return result_;
    }

    // ── Session setup ───────────────────────────────────────────────────

    template<RecordType T>
    void Decoder::begin() {
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

        if (Error err = prepare<T>()) {
            errors_.add(err);
            state_ = State::FAILED;
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "csvbind::Decoder: " << err.message() << std::endl;
            }
            throw Exception(std::move(err));
        }
        state_ = State::PREPARED;
    }

    template<RecordType T>
    Error Decoder::prepare() {
        if (config_.parseLocalizedHeader && !config_.localizationFunc) {
            return Error(Errc::ConfigOptionInvalid, "localization function required");
        }
        if (config_.chunkSize == 0) {
            return Error(Errc::ConfigOptionInvalid, "chunk size must be positive");
        }
        if (Error err = Schema::build<T>(schema_)) {
            return err;
        }

        std::vector<std::string> liveHeader;
        bool hasHeader = false;
        if (!config_.noHeaderMode) {
            ReadStatus status = source_.readRow(liveHeader);
            if (status == ReadStatus::QUOTE) {
                return Error(Errc::DecodeQuoteInvalid, "header");
            }
            hasHeader = status != ReadStatus::END;
            if (!hasHeader) {
                liveHeader.clear();
            }
        }
        next_row_ = hasHeader ? 2 : 1;

        const std::vector<ColumnSchema>& columns = schema_.columns();
        std::vector<std::string> displayHeaders;
        displayHeaders.reserve(columns.size());
        for (const ColumnSchema& column : columns) {
            if (config_.parseLocalizedHeader && column.inlineKind != InlineKind::DYNAMIC) {
                std::optional<std::string> text = config_.localizationFunc(column.key, ParameterMap{});
                if (!text) {
                    return Error(Errc::Localization, column.key);
                }
                displayHeaders.push_back(std::move(*text));
            } else {
                displayHeaders.push_back(column.key);
            }
        }

        ReconcileOptions options;
        options.noHeaderMode             = config_.noHeaderMode;
        options.requireColumnOrder       = config_.requireColumnOrder;
        options.allowUnrecognizedColumns = config_.allowUnrecognizedColumns;
        options.parseLocalizedHeader     = config_.parseLocalizedHeader;

        DecodePlan plan;
        if (Error err = reconcileDecodeHeader(schema_, displayHeaders, liveHeader, options, plan)) {
            return err;
        }
        return planColumns(plan);
    }

    inline Error Decoder::planColumns(const DecodePlan& plan) {
        const std::vector<ColumnSchema>& columns = schema_.columns();

        for (const auto& [key, columnConfig] : config_.columnConfigs()) {
            bool known = std::any_of(columns.begin(), columns.end(), [&key](const ColumnSchema& column) {
                return column.key == key || column.parentKey == key;
            });
            if (!known) {
                return Error(Errc::ConfigOptionInvalid, "column \"" + key + "\" not found");
            }
        }

        columns_.clear();
        dynamic_headers_.assign(schema_.nodes().size(), {});
        cursors_.assign(schema_.nodes().size(), -1);
        std::vector<std::string> header;

        for (const PlannedColumn& planned : plan.columns) {
            header.push_back(planned.header);
            ColumnPlan column;
            column.header = planned.header;
            if (planned.unrecognized) {
                column.unrecognized = true;
                columns_.push_back(std::move(column));
                continue;
            }

            const ColumnSchema& schemaColumn = columns[static_cast<size_t>(planned.schemaIndex)];
            column.schemaIndex = planned.schemaIndex;
            column.node        = schemaColumn.node;
            column.dynamic     = schemaColumn.inlineKind == InlineKind::DYNAMIC;
            column.omitEmpty   = schemaColumn.omitEmpty;
            column.ref         = schemaColumn.codec.ref;

            // A column override wins over the override of its inline group
            const DecodeColumnConfig* columnConfig = config_.findColumn(schemaColumn.key);
            if (columnConfig == nullptr && !schemaColumn.parentKey.empty()) {
                columnConfig = config_.findColumn(schemaColumn.parentKey);
            }
            column.config = columnConfig;
            if (columnConfig != nullptr) {
                column.trimSpace   = columnConfig->trimSpace;
                column.stopOnError = columnConfig->stopOnError;
            }

            if (columnConfig != nullptr && columnConfig->hasDecodeFunc()) {
                if (columnConfig->decodeType() != schemaColumn.codec.type) {
                    return Error(Errc::ConfigOptionInvalid,
                                 "decode function of column \"" + schemaColumn.key + "\" does not take " +
                                 schemaColumn.typeName);
                }
            } else if (!schemaColumn.codec.canDecode()) {
                return Error(Errc::TypeUnsupported, schemaColumn.typeName);
            } else {
                column.decode = schemaColumn.codec.decode;
            }

            if (column.dynamic) {
                dynamic_headers_[static_cast<size_t>(column.node)] =
                    plan.dynamicHeaders[static_cast<size_t>(planned.schemaIndex)];
            }
            columns_.push_back(std::move(column));
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "csvbind::Decoder: " << schema_.recordName() << " planned with "
                      << columns_.size() << " columns" << std::endl;
            for (const ColumnPlan& column : columns_) {
                std::cerr << "  " << column.header
                          << (column.unrecognized ? " (unrecognized)" : "")
                          << (column.dynamic ? " (dynamic)" : "") << std::endl;
            }
        }

        errors_.setHeader(std::move(header));
        result_.unrecognized_columns_     = plan.unrecognized;
        result_.missing_optional_columns_ = plan.missingOptional;
        updateTotals();
        return {};
    }

    // ── Row processing ──────────────────────────────────────────────────

    inline Decoder::Fetch Decoder::fetchRow() {
        ReadStatus status = source_.readRow(fields_);
        if (status == ReadStatus::END) {
            return Fetch::END;
        }

        row_  = next_row_++;
        line_ = config_.detectRowLine ? source_.sourceLine() : LINE_UNKNOWN;
        if (status == ReadStatus::OK && fields_.size() != columns_.size()) {
            status = ReadStatus::FIELD_COUNT;
        }
        if (status == ReadStatus::OK) {
            return Fetch::ROW;
        }

        if (status == ReadStatus::FIELD_COUNT) {
            structural_ = Error(Errc::DecodeRowFieldCount, "row " + std::to_string(row_));
        } else {
            structural_ = Error(Errc::DecodeQuoteInvalid, "row " + std::to_string(row_));
        }
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "csvbind::Decoder: malformed " << structural_.message() << std::endl;
        }
        if (config_.treatIncorrectStructureAsError || config_.stopOnError) {
            errors_.add(structural_);
            return Fetch::FATAL;
        }
        return Fetch::ROW_ERROR;
    }

    /// Decode one well formed row, returns true when an error must stop the session
    inline bool Decoder::decodeRow(void* record, RowErrors& rowErrors) {
        std::fill(cursors_.begin(), cursors_.end(), -1);
        bool stop = false;

        for (size_t col = 0; col < fields_.size(); ++col) {
            const ColumnPlan& column = columns_[col];
            if (column.unrecognized) {
                continue;
            }

            cell_ = fields_[col];
            if (config_.trimSpace || column.trimSpace) {
                cell_ = processors::trim(cell_);
            }
            if (column.config != nullptr) {
                for (const ProcessorFunc& fn : column.config->preprocessors) {
                    cell_ = fn(cell_);
                }
            }

            void* target = nullptr;
            if (column.dynamic) {
                const SchemaNode& node = schema_.node(column.node);
                void* group = schema_.resolve(record, column.node);
                int& cursor = cursors_[static_cast<size_t>(column.node)];
                if (cursor == -1) {
                    const std::vector<std::string>& names = dynamic_headers_[static_cast<size_t>(column.node)];
                    node.dynamic.header(group) = names;
                    node.dynamic.resize(group, names.size());
                    cursor = 0;
                }
                target = node.dynamic.value(group, static_cast<size_t>(cursor++));
            } else {
                target = schema_.resolve(record, column.node);
            }

            std::vector<Error> errs;
            bool decodeFailed = false;
            if (!column.omitEmpty || !cell_.empty()) {
                Error err = column.decode != nullptr ? column.decode(cell_, target)
                                                     : column.config->decodeFunc()(cell_, target);
                if (err) {
                    errs.push_back(std::move(err));
                    decodeFailed = true;
                }
            }
            if (!decodeFailed && column.config != nullptr && !column.config->validators.empty()) {
                ValueRef value = column.ref(target);
                for (const ValidatorFunc& validator : column.config->validators) {
                    if (Error err = validator(value)) {
                        errs.push_back(std::move(err));
                        if (config_.stopOnError || column.stopOnError) {
                            break;
                        }
                    }
                }
            }

            for (Error& err : errs) {
                CellError cellError(std::move(err), static_cast<int>(col), column.header);
                cellError.setValue(fields_[col]);
                if (column.config != nullptr && column.config->onCellError) {
                    column.config->onCellError(cellError);
                }
                rowErrors.add(std::move(cellError));
                if (config_.stopOnError || column.stopOnError) {
                    stop = true;
                    break;
                }
            }
        }
        return stop;
    }

    // Stop the session, remaining rows are only counted
    inline void Decoder::halt() {
        state_ = State::FAILED;
        std::vector<std::string> skipped;
        while (source_.readRow(skipped) != ReadStatus::END) {
            next_row_++;
        }
        updateTotals();
    }

    inline void Decoder::updateTotals() {
        result_.total_row_ = next_row_ - 1;
        errors_.setTotalRow(result_.total_row_);
    }

} // namespace csvbind
