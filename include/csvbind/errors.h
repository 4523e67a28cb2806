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
 * @file errors.h
 * @brief Error model of the CSVBIND library.
 *
 * Failures are identified by std::error_code values of the csvbind::Errc
 * enumeration and aggregated on three levels:
 *   - CellError:  one failing cell (cause, column, header, raw value, localization data)
 *   - RowErrors:  every failure of one row, cell errors and non-cell (structural) errors
 *   - Errors:     the document, mixing RowErrors with common (document-level) errors
 *
 * Setup, configuration and protocol failures are thrown as csvbind::Exception,
 * data failures are collected and returned.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include "definitions.h"

namespace csvbind {

    enum class Errc {
        TypeInvalid = 1,
        TypeUnsupported,
        TypeUnmatched,
        ValueNil,
        AlreadyFailed,
        Finished,
        Unexpected,

        TagOptionInvalid,
        ConfigOptionInvalid,
        Localization,

        HeaderColumnInvalid,
        HeaderColumnUnrecognized,
        HeaderColumnRequired,
        HeaderColumnDuplicated,
        HeaderColumnOrderInvalid,
        HeaderDynamicTypeInvalid,
        HeaderDynamicNotAllowNoHeaderMode,
        HeaderDynamicRequireColumnOrder,
        HeaderDynamicNotAllowUnrecognizedColumns,
        HeaderDynamicNotAllowLocalizedHeader,

        ValidationConversion,
        Validation,             // family code, matched by every Validation* code below
        ValidationLT,
        ValidationLTE,
        ValidationGT,
        ValidationGTE,
        ValidationRange,
        ValidationIN,
        ValidationStrLen,
        ValidationStrPrefix,
        ValidationStrSuffix,

        DecodeValueType,
        DecodeRowFieldCount,
        DecodeQuoteInvalid,

        EncodeValueType
    };

    const std::error_category& errorCategory() noexcept;
    std::error_code make_error_code(Errc code) noexcept;

} // namespace csvbind

namespace std {
    template<>
    struct is_error_code_enum<csvbind::Errc> : true_type {};
}

namespace csvbind {

    // Identity test including the Validation family
    bool is(const std::error_code& code, Errc target) noexcept;

    /**
     * @brief A single failure: an error code plus free-form detail text.
     * A default constructed Error means success.
     */
    class Error {
        std::error_code         code_;
        std::string             detail_;

    public:
        Error() = default;
        Error(Errc code, std::string detail = {});
        Error(std::error_code code, std::string detail = {});

        explicit operator bool() const                          { return static_cast<bool>(code_); }
        const std::error_code&  code() const                    { return code_; }
        const std::string&      detail() const                  { return detail_; }
        std::string             message() const;

        bool                    is(Errc target) const           { return csvbind::is(code_, target); }
        bool                    is(const std::error_code& target) const;
    };

    /**
     * @brief Exception carrying an Error, thrown for setup and protocol failures.
     */
    class Exception : public std::runtime_error {
        Error                   error_;

    public:
        explicit Exception(Error error);

        const Error&            error() const                   { return error_; }
        bool                    is(Errc target) const           { return error_.is(target); }
    };

    /**
     * @brief Failure of one cell.
     */
    class CellError {
        Error                   cause_;
        ParameterMap            params_;            // extra named parameters for rendering
        std::string             localization_key_;
        int                     column_ = NO_COLUMN;
        std::string             header_;
        std::string             value_;             // raw cell text as read from the source

    public:
        CellError(Error cause, int column, std::string header);

        const Error&            cause() const                   { return cause_; }
        int                     column() const                  { return column_; }
        const std::string&      header() const                  { return header_; }
        const std::string&      value() const                   { return value_; }
        void                    setValue(std::string value)     { value_ = std::move(value); }
        const std::string&      localizationKey() const         { return localization_key_; }
        void                    setLocalizationKey(std::string key) { localization_key_ = std::move(key); }
        const ParameterMap&     params() const                  { return params_; }
        std::string             message() const                 { return cause_.message(); }
        bool                    is(Errc target) const           { return cause_.is(target); }
        bool                    is(const std::error_code& target) const { return cause_.is(target); }

        template<typename V>
        CellError&              withParam(const std::string& key, V value) {
            params_[key] = makeParam(std::move(value));
            return *this;
        }
    };

    /**
     * @brief Every failure of one row, tagged with row number and source line.
     */
    class RowErrors {
    public:
        using Entry = std::variant<CellError, Error>;

    private:
        std::vector<Entry>      entries_;
        int64_t                 row_ = 0;
        int64_t                 line_ = LINE_UNKNOWN;

    public:
        RowErrors() = default;
        RowErrors(int64_t row, int64_t line) : row_(row), line_(line) {}

        void                    add(CellError error)            { entries_.emplace_back(std::move(error)); }
        void                    add(Error error)                { entries_.emplace_back(std::move(error)); }
        void                    clear()                         { entries_.clear(); }
        const std::vector<Entry>& entries() const               { return entries_; }
        bool                    hasError() const                { return !entries_.empty(); }
        int64_t                 line() const                    { return line_; }
        int64_t                 row() const                     { return row_; }
        size_t                  totalCellError() const;
        size_t                  totalError() const              { return entries_.size(); }

        bool                    is(Errc target) const;
        bool                    is(const std::error_code& target) const;
        std::string             message() const;
    };

    /**
     * @brief Document-level error collection of one decode session.
     */
    class Errors {
    public:
        using Entry = std::variant<RowErrors, Error>;

    private:
        std::vector<Entry>      entries_;
        int64_t                 total_row_ = 0;     // rows of the input, header included
        std::vector<std::string> header_;           // resolved column headers

    public:
        void                    add(RowErrors error)            { entries_.emplace_back(std::move(error)); }
        void                    add(Error error)                { entries_.emplace_back(std::move(error)); }
        const std::vector<Entry>& entries() const               { return entries_; }
        bool                    hasError() const                { return !entries_.empty(); }
        const std::vector<std::string>& header() const          { return header_; }
        void                    setHeader(std::vector<std::string> header) { header_ = std::move(header); }
        int64_t                 totalRow() const                { return total_row_; }
        void                    setTotalRow(int64_t total)      { total_row_ = total; }
        size_t                  totalCellError() const;
        size_t                  totalError() const;
        size_t                  totalRowError() const;

        bool                    is(Errc target) const;
        bool                    is(const std::error_code& target) const;
        std::string             message() const;
    };

} // namespace csvbind
