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
 * @file render.h
 * @brief Renderers turning an Errors collection into human readable output.
 *
 * SimpleRenderer produces one text block: a summary line, one line per row
 * error and one line per common error. CsvRenderer produces a table with one
 * row per row error, placing every cell error under the column it belongs to.
 *
 * Format keys and cell localization keys may contain {{.Name}} placeholders,
 * resolved from the render parameters:
 *   document  TotalRow, TotalRowError, TotalCellError, TotalError, CrLf, Tab
 *   row       Row, Line, Error (SimpleRenderer only: the joined cell texts)
 *   cell      Column, ColumnHeader, Value, Error, plus CellError::withParam values
 *
 * A failed translation never aborts rendering: the untranslated key is used
 * and the failure is reported by translationErrors().
 */

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "definitions.h"
#include "errors.h"
#include "row_source.h"

namespace csvbind {

    // Replace {{.Name}} placeholders, unknown names render as "<no value>"
    std::string processParams(const std::string& format, const ParameterMap& params);

    /**
     * @brief Custom cell rendering.
     * Return false to drop the cell, true with an empty @p out to fall back to
     * the default rendering, true with text in @p out to override it.
     */
    using CellRenderFunc = std::function<bool(const RowErrors& row, const CellError& cell,
                                              const ParameterMap& params, std::string& out)>;

    // Custom rendering of errors not tied to a cell, std::nullopt reports a translation failure
    using CommonErrorRenderFunc = std::function<std::optional<std::string>(const Error& error,
                                                                           const ParameterMap& params)>;

    struct RenderOptions {
        std::string                 cellSeparator = ", ";       // joins cell texts within a row
        std::string                 lineBreak = "\n";           // value of {{.CrLf}}
        bool                        localizeCellFields = true;  // translate string parameters of cells
        bool                        localizeCellHeader = true;  // translate the column header of cells
        ParameterMap                params;                     // extra parameters, override built-in ones
        LocalizationFunc            localizationFunc;
        CellRenderFunc              cellRenderFunc;
        CommonErrorRenderFunc       commonErrorRenderFunc;
    };

    struct ErrorRenderConfig : RenderOptions {
        std::string                 headerFormatKey = "Error content: TotalRow: {{.TotalRow}}, "
                                                      "TotalRowError: {{.TotalRowError}}, "
                                                      "TotalCellError: {{.TotalCellError}}, "
                                                      "TotalError: {{.TotalError}}";
        std::string                 rowFormatKey = "Row {{.Row}} (line {{.Line}}): {{.Error}}";
        std::string                 rowSeparator = "\n";
    };

    struct CsvRenderConfig : RenderOptions {
        using HeaderRenderFunc = std::function<void(std::vector<std::string>& header, const ParameterMap& params)>;

        bool                        renderHeader = true;
        int                         rowNumberColumn = 0;        // -1 hides the column
        int                         lineNumberColumn = 1;       // -1 hides the column
        int                         commonErrorColumn = 2;      // -1 hides the column
        HeaderRenderFunc            headerRenderFunc;
    };

    namespace detail {

        // Parameter and translation handling shared by the renderers
        template<typename Config>
        class RenderBase {
        protected:
            const Errors&               source_;
            Config                      config_;
            std::vector<Error>          trans_errors_;

            RenderBase(const Errors& source, Config config)
                : source_(source), config_(std::move(config)) {}

            ParameterMap                documentParams() const;
            ParameterMap                rowParams(const RowErrors& row, const ParameterMap& base) const;
            std::string                 renderCell(const RowErrors& row, const CellError& cell,
                                                   const ParameterMap& base, bool& keep);
            std::string                 renderCommonError(const Error& error, const ParameterMap& params);

            std::optional<std::string>  localizeKey(const std::string& key, const ParameterMap& params);
            std::string                 localizeKeySkipError(const std::string& key, const ParameterMap& params);
        };

    } // namespace detail

    class SimpleRenderer : detail::RenderBase<ErrorRenderConfig> {
    public:
        explicit SimpleRenderer(const Errors& errors, ErrorRenderConfig config = {});

        std::string                 render();
        const std::vector<Error>&   translationErrors() const       { return trans_errors_; }

    private:
        std::string                 renderRow(const RowErrors& row, const ParameterMap& base);
    };

    class CsvRenderer : detail::RenderBase<CsvRenderConfig> {
        int                         first_cell_column_ = 0;

    public:
        explicit CsvRenderer(const Errors& errors, CsvRenderConfig config = {});

        std::vector<std::vector<std::string>> render();
        std::string                 renderAsString();
        bool                        renderTo(RowSink& sink);
        const std::vector<Error>&   translationErrors() const       { return trans_errors_; }

        // Normalized positions of the fixed columns, -1 when hidden
        int                         rowNumberColumn() const         { return config_.rowNumberColumn; }
        int                         lineNumberColumn() const        { return config_.lineNumberColumn; }
        int                         commonErrorColumn() const       { return config_.commonErrorColumn; }

    private:
        std::vector<std::string>    renderRow(const RowErrors& row, const ParameterMap& base, size_t width);
    };

} // namespace csvbind
