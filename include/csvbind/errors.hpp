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
 * @file errors.hpp
 * @brief Error model implementations.
 */

#include "errors.h"

namespace csvbind {

    // ── Error category ──────────────────────────────────────────────────

    namespace detail {

        class ErrorCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "csvbind"; }

            std::string message(int value) const override {
                switch (static_cast<Errc>(value)) {
                    case Errc::TypeInvalid: return "ErrTypeInvalid";
                    case Errc::TypeUnsupported: return "ErrTypeUnsupported";
                    case Errc::TypeUnmatched: return "ErrTypeUnmatched";
                    case Errc::ValueNil: return "ErrValueNil";
                    case Errc::AlreadyFailed: return "ErrAlreadyFailed";
                    case Errc::Finished: return "ErrFinished";
                    case Errc::Unexpected: return "ErrUnexpected";
                    case Errc::TagOptionInvalid: return "ErrTagOptionInvalid";
                    case Errc::ConfigOptionInvalid: return "ErrConfigOptionInvalid";
                    case Errc::Localization: return "ErrLocalization";
                    case Errc::HeaderColumnInvalid: return "ErrHeaderColumnInvalid";
                    case Errc::HeaderColumnUnrecognized: return "ErrHeaderColumnUnrecognized";
                    case Errc::HeaderColumnRequired: return "ErrHeaderColumnRequired";
                    case Errc::HeaderColumnDuplicated: return "ErrHeaderColumnDuplicated";
                    case Errc::HeaderColumnOrderInvalid: return "ErrHeaderColumnOrderInvalid";
                    case Errc::HeaderDynamicTypeInvalid: return "ErrHeaderDynamicTypeInvalid";
                    case Errc::HeaderDynamicNotAllowNoHeaderMode: return "ErrHeaderDynamicNotAllowNoHeaderMode";
                    case Errc::HeaderDynamicRequireColumnOrder: return "ErrHeaderDynamicRequireColumnOrder";
                    case Errc::HeaderDynamicNotAllowUnrecognizedColumns: return "ErrHeaderDynamicNotAllowUnrecognizedColumns";
                    case Errc::HeaderDynamicNotAllowLocalizedHeader: return "ErrHeaderDynamicNotAllowLocalizedHeader";
                    case Errc::ValidationConversion: return "ErrValidationConversion";
                    case Errc::Validation: return "ErrValidation";
                    case Errc::ValidationLT: return "ErrValidation: LT";
                    case Errc::ValidationLTE: return "ErrValidation: LTE";
                    case Errc::ValidationGT: return "ErrValidation: GT";
                    case Errc::ValidationGTE: return "ErrValidation: GTE";
                    case Errc::ValidationRange: return "ErrValidation: Range";
                    case Errc::ValidationIN: return "ErrValidation: IN";
                    case Errc::ValidationStrLen: return "ErrValidation: StrLen";
                    case Errc::ValidationStrPrefix: return "ErrValidation: StrPrefix";
                    case Errc::ValidationStrSuffix: return "ErrValidation: StrSuffix";
                    case Errc::DecodeValueType: return "ErrDecodeValueType";
                    case Errc::DecodeRowFieldCount: return "ErrDecodeRowFieldCount";
                    case Errc::DecodeQuoteInvalid: return "ErrDecodeQuoteInvalid";
                    case Errc::EncodeValueType: return "ErrEncodeValueType";
                }
                return "ErrUnknown(" + std::to_string(value) + ")";
            }
        };

    } // namespace detail

    inline const std::error_category& errorCategory() noexcept {
        static const detail::ErrorCategory category;
        return category;
    }

    inline std::error_code make_error_code(Errc code) noexcept {
        return {static_cast<int>(code), errorCategory()};
    }

    inline bool is(const std::error_code& code, Errc target) noexcept {
        if (code.category() != errorCategory()) {
            return false;
        }
        if (code.value() == static_cast<int>(target)) {
            return true;
        }
        if (target == Errc::Validation) {
            return code.value() >= static_cast<int>(Errc::ValidationLT) &&
                   code.value() <= static_cast<int>(Errc::ValidationStrSuffix);
        }
        return false;
    }

    // ── Error ───────────────────────────────────────────────────────────

    inline Error::Error(Errc code, std::string detail)
        : code_(make_error_code(code))
        , detail_(std::move(detail))
    {
    }

    inline Error::Error(std::error_code code, std::string detail)
        : code_(code)
        , detail_(std::move(detail))
    {
    }

    inline std::string Error::message() const {
        if (!code_) {
            return detail_;
        }
        if (detail_.empty()) {
            return code_.message();
        }
        return code_.message() + ": " + detail_;
    }

    inline bool Error::is(const std::error_code& target) const {
        if (target.category() == errorCategory()) {
            return csvbind::is(code_, static_cast<Errc>(target.value()));
        }
        return code_ == target;
    }

    inline Exception::Exception(Error error)
        : std::runtime_error(error.message())
        , error_(std::move(error))
    {
    }

    inline CellError::CellError(Error cause, int column, std::string header)
        : cause_(std::move(cause))
        , column_(column)
        , header_(std::move(header))
    {
    }

    // ── RowErrors ───────────────────────────────────────────────────────

    inline size_t RowErrors::totalCellError() const {
        size_t count = 0;
        for (const auto& entry : entries_) {
            if (std::holds_alternative<CellError>(entry)) {
                ++count;
            }
        }
        return count;
    }

    inline bool RowErrors::is(Errc target) const {
        return is(make_error_code(target));
    }

    inline bool RowErrors::is(const std::error_code& target) const {
        for (const auto& entry : entries_) {
            bool match = std::visit([&](const auto& error) { return error.is(target); }, entry);
            if (match) {
                return true;
            }
        }
        return false;
    }

    inline std::string RowErrors::message() const {
        std::string msg;
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (i > 0) {
                msg += ", ";
            }
            msg += std::visit([](const auto& error) { return error.message(); }, entries_[i]);
        }
        return msg;
    }

    // ── Errors ──────────────────────────────────────────────────────────

    inline size_t Errors::totalRowError() const {
        size_t count = 0;
        for (const auto& entry : entries_) {
            if (std::holds_alternative<RowErrors>(entry)) {
                ++count;
            }
        }
        return count;
    }

    inline size_t Errors::totalCellError() const {
        size_t count = 0;
        for (const auto& entry : entries_) {
            if (const auto* row = std::get_if<RowErrors>(&entry)) {
                count += row->totalCellError();
            }
        }
        return count;
    }

    inline size_t Errors::totalError() const {
        size_t count = 0;
        for (const auto& entry : entries_) {
            if (const auto* row = std::get_if<RowErrors>(&entry)) {
                count += row->totalError();
            } else {
                ++count;
            }
        }
        return count;
    }

    inline bool Errors::is(Errc target) const {
        return is(make_error_code(target));
    }

    inline bool Errors::is(const std::error_code& target) const {
        for (const auto& entry : entries_) {
            bool match = std::visit([&](const auto& error) { return error.is(target); }, entry);
            if (match) {
                return true;
            }
        }
        return false;
    }

    inline std::string Errors::message() const {
        std::string msg;
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (i > 0) {
                msg += ", ";
            }
            msg += std::visit([](const auto& error) { return error.message(); }, entries_[i]);
        }
        return msg;
    }

} // namespace csvbind
