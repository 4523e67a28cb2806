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
 * @file encoder.h
 * @brief Encoder - row engine turning record values into sink rows.
 *
 * The header is derived and written on the first call. Dynamic inline groups
 * take their columns from the first row of that call. Unlike decoding, any
 * failure ends the session: it is thrown as csvbind::Exception and every later
 * call raises Errc::AlreadyFailed.
 *
 * Usage:
 *     std::ostringstream out;
 *     csvbind::CsvRowWriter writer(out);
 *     csvbind::Encoder encoder(writer);
 *     encoder.encode(people);
 *     encoder.finish();
 */

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <typeindex>
#include <vector>

#include "codec.h"
#include "definitions.h"
#include "errors.h"
#include "header.h"
#include "row_source.h"
#include "schema.h"

namespace csvbind {

    class EncodeColumnConfig {
    public:
        using ErasedEncodeFunc = std::function<Error(const void* source, bool omitEmpty, std::string& out)>;

        bool                        skip = false;           // leave the column out of the output
        std::vector<ProcessorFunc>  postprocessors;         // applied in order after encoding

        /**
         * @brief Replace the column codec. V must be the exact value type of the column
         *        (the element type for dynamic groups).
         * @param fn  callable as Error(const V&, bool omitEmpty, std::string& out)
         */
        template<typename V, typename F>
        void                        setEncodeFunc(F fn) {
            encode_type_ = typeid(V);
            encode_func_ = [fn = std::move(fn)](const void* source, bool omitEmpty, std::string& out) -> Error {
                return fn(*static_cast<const V*>(source), omitEmpty, out);
            };
        }

        const ErasedEncodeFunc&     encodeFunc() const      { return encode_func_; }
        std::type_index             encodeType() const      { return encode_type_; }
        bool                        hasEncodeFunc() const   { return static_cast<bool>(encode_func_); }

    private:
        std::type_index             encode_type_ = typeid(void);
        ErasedEncodeFunc            encode_func_;
    };

    struct EncodeConfig {
        bool                        noHeaderMode = false;
        bool                        localizeHeader = false;     // write localized header texts
        LocalizationFunc            localizationFunc;

        // Create-or-get the overrides of a column key or inline group key
        EncodeColumnConfig&         column(const std::string& key)      { return columns_[key]; }
        const std::map<std::string, EncodeColumnConfig>& columnConfigs() const { return columns_; }
        const EncodeColumnConfig*   findColumn(const std::string& key) const {
            auto it = columns_.find(key);
            return it == columns_.end() ? nullptr : &it->second;
        }

    private:
        std::map<std::string, EncodeColumnConfig> columns_;
    };

    class Encoder {
        enum class State : uint8_t {
            FRESH,
            STREAMING,
            FINISHED,
            FAILED
        };

        struct ColumnPlan {
            int                         node = -1;
            int                         dynamicSlot = -1;
            std::string                 header;
            bool                        omitEmpty = false;
            bool                        skip = false;
            EncodeFn                    encode = nullptr;
            const EncodeColumnConfig*   config = nullptr;
        };

        RowSink&                    sink_;
        EncodeConfig                config_;
        State                       state_ = State::FRESH;

        Schema                      schema_;
        std::vector<ColumnPlan>     columns_;
        std::vector<int>            cursors_;       // per arena node, reset every row

        std::vector<std::string>    record_;        // reusable output row
        size_t                      row_cnt_ = 0;   // rows written, header excluded

    public:
        explicit Encoder(RowSink& sink, EncodeConfig config = {});
        Encoder(const Encoder&) = delete;
        Encoder& operator=(const Encoder&) = delete;

        template<RecordType T>
        void                        encode(const std::vector<T>& rows);
        template<RecordType T>
        void                        encode(const std::vector<T*>& rows);
        template<RecordType T>
        void                        encodeOne(const T& row);
        template<RecordType T>
        void                        encodeOne(const T* row);

        void                        finish();
        size_t                      rowCount() const                { return row_cnt_; }
        const Schema&               schema() const                  { return schema_; }

    private:
        template<RecordType T>
        void                        begin(const T* firstRow);
        template<RecordType T>
        Error                       prepare(const T* firstRow);
        Error                       planColumns(const std::vector<EncodeColumn>& columns);

        Error                       encodeRow(const void* record);
        [[noreturn]] void           fail(Error error);
    };

} // namespace csvbind
