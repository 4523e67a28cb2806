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
 * @file decoder.h
 * @brief Decoder - row engine turning source rows into record values.
 *
 * A decoder session is bound to one RowSource and, on the first call, to one
 * record type. The schema is resolved and reconciled with the header before
 * the first row is touched, every failure found there is thrown as
 * csvbind::Exception. Data failures are collected in errors().
 *
 * Usage:
 *     std::istringstream input("name,age\nAlice,30\nBob,x\n");
 *     csvbind::CsvRowReader reader(input);
 *     csvbind::DecodeConfig cfg;
 *     cfg.stopOnError = false;
 *     cfg.column("age").validators = { csvbind::validators::range(0, 150) };
 *
 *     csvbind::Decoder decoder(reader, cfg);
 *     std::vector<Person> people;
 *     if (!decoder.decode(people)) {
 *         std::cerr << decoder.errors().message() << std::endl;
 *     }
 *
 * Session states: FRESH -> PREPARED -> STREAMING -> FINISHED, or FAILED once
 * a stop-on-error condition or a fatal structure error occurred.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include "codec.h"
#include "definitions.h"
#include "errors.h"
#include "header.h"
#include "row_source.h"
#include "schema.h"
#include "validator.h"

namespace csvbind {

    using CellErrorFunc = std::function<void(CellError& error)>;

    /**
     * @brief Overrides for one column, or for every column of an inline group.
     */
    class DecodeColumnConfig {
    public:
        using ErasedDecodeFunc = std::function<Error(std::string_view text, void* target)>;

        bool                        trimSpace = false;      // trim this column even when DecodeConfig::trimSpace is off
        bool                        stopOnError = false;    // stop the session on errors of this column
        std::vector<ProcessorFunc>  preprocessors;          // applied in order before decoding
        std::vector<ValidatorFunc>  validators;             // applied in order after decoding
        CellErrorFunc               onCellError;            // may attach a localization key and parameters

        /**
         * @brief Replace the column codec. V must be the exact value type of the column
         *        (the element type for dynamic groups).
         * @param fn  callable as Error(std::string_view, V&)
         */
        template<typename V, typename F>
        void                        setDecodeFunc(F fn) {
            decode_type_ = typeid(V);
            decode_func_ = [fn = std::move(fn)](std::string_view text, void* target) -> Error {
                return fn(text, *static_cast<V*>(target));
            };
        }

        const ErasedDecodeFunc&     decodeFunc() const      { return decode_func_; }
        std::type_index             decodeType() const      { return decode_type_; }
        bool                        hasDecodeFunc() const   { return static_cast<bool>(decode_func_); }

    private:
        std::type_index             decode_type_ = typeid(void);
        ErasedDecodeFunc            decode_func_;
    };

    struct DecodeConfig {
        bool                        noHeaderMode = false;
        bool                        stopOnError = true;
        bool                        trimSpace = false;
        bool                        requireColumnOrder = true;
        bool                        parseLocalizedHeader = false;       // header row holds localized keys
        bool                        allowUnrecognizedColumns = false;
        bool                        treatIncorrectStructureAsError = true;
        bool                        detectRowLine = false;              // ask the source for row lines
        LocalizationFunc            localizationFunc;
        size_t                      chunkSize = DEFAULT_CHUNK_SIZE;     // rows decoded per batch

        // Create-or-get the overrides of a column key or inline group key
        DecodeColumnConfig&         column(const std::string& key)      { return columns_[key]; }
        const std::map<std::string, DecodeColumnConfig>& columnConfigs() const { return columns_; }
        const DecodeColumnConfig*   findColumn(const std::string& key) const {
            auto it = columns_.find(key);
            return it == columns_.end() ? nullptr : &it->second;
        }

    private:
        std::map<std::string, DecodeColumnConfig> columns_;
    };

    class DecodeResult {
        int64_t                     total_row_ = 0;
        std::vector<std::string>    unrecognized_columns_;
        std::vector<std::string>    missing_optional_columns_;

        friend class Decoder;

    public:
        const std::vector<std::string>& missingOptionalColumns() const  { return missing_optional_columns_; }
        int64_t                     totalRow() const                    { return total_row_; }
        const std::vector<std::string>& unrecognizedColumns() const     { return unrecognized_columns_; }
    };

    class Decoder {
        enum class State : uint8_t {
            FRESH,
            PREPARED,
            STREAMING,
            FINISHED,
            FAILED
        };

        enum class Fetch : uint8_t {
            ROW,
            ROW_ERROR,      // malformed record kept as a row error
            END,
            FATAL           // malformed record stopped the session
        };

        struct ColumnPlan {
            int                         schemaIndex = -1;
            int                         node = -1;
            std::string                 header;
            bool                        unrecognized = false;
            bool                        dynamic = false;
            bool                        omitEmpty = false;
            bool                        trimSpace = false;
            bool                        stopOnError = false;
            DecodeFn                    decode = nullptr;
            RefFn                       ref = nullptr;
            const DecodeColumnConfig*   config = nullptr;
        };

        RowSource&                  source_;
        DecodeConfig                config_;
        State                       state_ = State::FRESH;

        Schema                      schema_;
        std::vector<ColumnPlan>     columns_;
        std::vector<std::vector<std::string>> dynamic_headers_;  // per arena node
        std::vector<int>            cursors_;                    // per arena node, reset every row

        Errors                      errors_;
        RowErrors                   last_row_errors_;
        DecodeResult                result_;

        std::vector<std::string>    fields_;                     // reusable row buffer
        std::string                 cell_;                       // reusable cell buffer
        int64_t                     next_row_ = 1;
        int64_t                     row_ = 0;
        int64_t                     line_ = LINE_UNKNOWN;
        Error                       structural_;

    public:
        explicit Decoder(RowSource& source, DecodeConfig config = {});
        Decoder(const Decoder&) = delete;
        Decoder& operator=(const Decoder&) = delete;

        template<RecordType T>
        bool                        decode(std::vector<T>& out);
        template<RecordType T>
        bool                        decodeOne(T& out);
        template<RecordType T>
        bool                        decodeOne(T* out);

        const Errors&               errors() const                  { return errors_; }
        const DecodeResult&         finish();
        const RowErrors&            lastRowErrors() const           { return last_row_errors_; }
        const DecodeResult&         result() const                  { return result_; }
        const Schema&               schema() const                  { return schema_; }

    private:
        template<RecordType T>
        void                        begin();
        template<RecordType T>
        Error                       prepare();
        Error                       planColumns(const DecodePlan& plan);

        Fetch                       fetchRow();
        bool                        decodeRow(void* record, RowErrors& rowErrors);
        void                        halt();
        void                        updateTotals();
    };

} // namespace csvbind
