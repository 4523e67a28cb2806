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
 * @file render.hpp
 * @brief Renderer implementations.
 */

#include "render.h"
#include "csv_writer.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>

namespace csvbind {

    inline std::string processParams(const std::string& format, const ParameterMap& params) {
        std::string out;
        out.reserve(format.size());
        size_t pos = 0;
        while (pos < format.size()) {
            const size_t open = format.find("{{", pos);
            if (open == std::string::npos) {
                break;
            }
            const size_t close = format.find("}}", open + 2);
            if (close == std::string::npos) {
                break;
            }
            out.append(format, pos, open - pos);

            std::string_view action(format.data() + open + 2, close - open - 2);
            while (!action.empty() && action.front() == ' ') action.remove_prefix(1);
            while (!action.empty() && action.back() == ' ') action.remove_suffix(1);
            if (action.size() > 1 && action.front() == '.') {
                auto it = params.find(std::string(action.substr(1)));
                out += it != params.end() ? paramToString(it->second) : "<no value>";
            } else {
                out.append(format, open, close + 2 - open);
            }
            pos = close + 2;
        }
        out.append(format, pos, std::string::npos);
        return out;
    }

    // ── Shared rendering ────────────────────────────────────────────────

    namespace detail {

        template<typename Config>
        ParameterMap RenderBase<Config>::documentParams() const {
            ParameterMap params;
            params["CrLf"]           = makeParam(config_.lineBreak);
            params["Tab"]            = makeParam(std::string("\t"));
            params["TotalRow"]       = makeParam(source_.totalRow());
            params["TotalError"]     = makeParam(source_.totalError());
            params["TotalRowError"]  = makeParam(source_.totalRowError());
            params["TotalCellError"] = makeParam(source_.totalCellError());
            for (const auto& [key, value] : config_.params) {
                params[key] = value;
            }
            return params;
        }

        template<typename Config>
        ParameterMap RenderBase<Config>::rowParams(const RowErrors& row, const ParameterMap& base) const {
            ParameterMap params = base;
            params["Row"]  = makeParam(row.row());
            params["Line"] = makeParam(row.line());
            return params;
        }

        template<typename Config>
        std::string RenderBase<Config>::renderCell(const RowErrors& row, const CellError& cell,
                                                   const ParameterMap& base, bool& keep) {
            keep = true;
            ParameterMap params = base;
            for (const auto& [key, value] : cell.params()) {
                const std::string* text = std::get_if<std::string>(&value);
                if (config_.localizeCellFields && text != nullptr) {
                    std::optional<std::string> translated = localizeKey(*text, params);
                    params[key] = translated ? makeParam(*translated) : value;
                } else {
                    params[key] = value;
                }
            }
            params["Column"]       = makeParam(cell.column());
            params["ColumnHeader"] = makeParam(config_.localizeCellHeader ? localizeKeySkipError(cell.header(), params)
                                                                          : cell.header());
            params["Value"]        = makeParam(cell.value());
            params["Error"]        = makeParam(cell.message());

            if (config_.cellRenderFunc) {
                std::string custom;
                if (!config_.cellRenderFunc(row, cell, base, custom)) {
                    keep = false;
                    return {};
                }
                if (!custom.empty()) {
                    return custom;
                }
            }

            const std::string& key = cell.localizationKey().empty() ? cell.message() : cell.localizationKey();
            return localizeKeySkipError(key, params);
        }

        template<typename Config>
        std::string RenderBase<Config>::renderCommonError(const Error& error, const ParameterMap& params) {
            if (!config_.commonErrorRenderFunc) {
                return localizeKeySkipError(error.message(), params);
            }
            std::optional<std::string> text = config_.commonErrorRenderFunc(error, params);
            if (!text) {
                trans_errors_.emplace_back(Errc::Localization, error.message());
                return {};
            }
            return *text;
        }

        template<typename Config>
        std::optional<std::string> RenderBase<Config>::localizeKey(const std::string& key, const ParameterMap& params) {
            if (!config_.localizationFunc) {
                return processParams(key, params);
            }
            std::optional<std::string> text = config_.localizationFunc(key, params);
            if (!text) {
                trans_errors_.emplace_back(Errc::Localization, key);
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "csvbind::render: no translation for \"" << key << "\"" << std::endl;
                }
            }
            return text;
        }

        template<typename Config>
        std::string RenderBase<Config>::localizeKeySkipError(const std::string& key, const ParameterMap& params) {
            std::optional<std::string> text = localizeKey(key, params);
            return processParams(text ? *text : key, params);
        }

    } // namespace detail

    // ── SimpleRenderer ──────────────────────────────────────────────────

    inline SimpleRenderer::SimpleRenderer(const Errors& errors, ErrorRenderConfig config)
        : RenderBase(errors, std::move(config))
    {
    }

    inline std::string SimpleRenderer::render() {
        trans_errors_.clear();
        const ParameterMap params = documentParams();
        std::vector<std::string> content;
        content.reserve(source_.entries().size() + 1);

        if (!config_.headerFormatKey.empty()) {
            std::string header = localizeKeySkipError(config_.headerFormatKey, params);
            if (!header.empty()) {
                content.push_back(std::move(header));
            }
        }

        for (const Errors::Entry& entry : source_.entries()) {
            std::string detail;
            if (const auto* row = std::get_if<RowErrors>(&entry)) {
                detail = renderRow(*row, params);
            } else {
                detail = renderCommonError(std::get<Error>(entry), params);
            }
            if (!detail.empty()) {
                content.push_back(std::move(detail));
            }
        }

        std::string out;
        for (size_t i = 0; i < content.size(); ++i) {
            if (i > 0) out += config_.rowSeparator;
            out += content[i];
        }
        return out;
    }

    inline std::string SimpleRenderer::renderRow(const RowErrors& row, const ParameterMap& base) {
        ParameterMap params = rowParams(row, base);
        std::string joined;
        bool first = true;
        for (const RowErrors::Entry& entry : row.entries()) {
            std::string detail;
            if (const auto* cell = std::get_if<CellError>(&entry)) {
                bool keep = true;
                detail = renderCell(row, *cell, params, keep);
            } else {
                detail = renderCommonError(std::get<Error>(entry), params);
            }
            if (detail.empty()) {
                continue;
            }
            if (!first) joined += config_.cellSeparator;
            joined += detail;
            first = false;
        }

        if (config_.rowFormatKey.empty()) {
            return {};
        }
        params["Error"] = makeParam(joined);
        return localizeKeySkipError(config_.rowFormatKey, params);
    }

    // ── CsvRenderer ─────────────────────────────────────────────────────

    inline CsvRenderer::CsvRenderer(const Errors& errors, CsvRenderConfig config)
        : RenderBase(errors, std::move(config))
    {
        // Visible fixed columns keep their relative order and are packed to the front
        std::vector<int*> fixed;
        for (int* index : {&config_.rowNumberColumn, &config_.lineNumberColumn, &config_.commonErrorColumn}) {
            if (*index >= 0) {
                fixed.push_back(index);
            } else {
                *index = -1;
            }
        }
        std::stable_sort(fixed.begin(), fixed.end(), [](const int* a, const int* b) { return *a < *b; });
        for (size_t i = 0; i < fixed.size(); ++i) {
            *fixed[i] = static_cast<int>(i);
        }
        first_cell_column_ = static_cast<int>(fixed.size());
    }

    inline std::vector<std::vector<std::string>> CsvRenderer::render() {
        trans_errors_.clear();
        const ParameterMap params = documentParams();
        const size_t width = source_.header().size() + static_cast<size_t>(first_cell_column_);

        std::vector<std::vector<std::string>> table;
        table.reserve(source_.entries().size() + 1);

        if (config_.renderHeader) {
            std::vector<std::string> header(width);
            if (config_.rowNumberColumn >= 0)   header[static_cast<size_t>(config_.rowNumberColumn)] = "Row";
            if (config_.lineNumberColumn >= 0)  header[static_cast<size_t>(config_.lineNumberColumn)] = "Line";
            if (config_.commonErrorColumn >= 0) header[static_cast<size_t>(config_.commonErrorColumn)] = "CommonError";
            std::copy(source_.header().begin(), source_.header().end(), header.begin() + first_cell_column_);
            if (config_.headerRenderFunc) {
                config_.headerRenderFunc(header, params);
            }
            table.push_back(std::move(header));
        }

        // Common errors have no row to live in
        for (const Errors::Entry& entry : source_.entries()) {
            if (const auto* row = std::get_if<RowErrors>(&entry)) {
                table.push_back(renderRow(*row, params, width));
            }
        }
        return table;
    }

    inline std::vector<std::string> CsvRenderer::renderRow(const RowErrors& row, const ParameterMap& base, size_t width) {
        std::vector<std::string> content(width);
        if (config_.rowNumberColumn >= 0) {
            content[static_cast<size_t>(config_.rowNumberColumn)] = std::to_string(row.row());
        }
        if (config_.lineNumberColumn >= 0) {
            content[static_cast<size_t>(config_.lineNumberColumn)] = std::to_string(row.line());
        }

        const ParameterMap params = rowParams(row, base);
        std::map<int, std::vector<std::string>> byColumn;
        for (const RowErrors::Entry& entry : row.entries()) {
            int index = config_.commonErrorColumn;
            std::string detail;
            if (const auto* cell = std::get_if<CellError>(&entry)) {
                bool keep = true;
                detail = renderCell(row, *cell, params, keep);
                if (!keep) {
                    continue;
                }
                const int column = cell->column() + first_cell_column_;
                if (cell->column() != NO_COLUMN && column >= first_cell_column_ && column < static_cast<int>(width)) {
                    index = column;
                }
            } else {
                detail = renderCommonError(std::get<Error>(entry), params);
            }
            if (index >= 0) {
                byColumn[index].push_back(std::move(detail));
            }
        }

        for (const auto& [index, items] : byColumn) {
            std::string& cellText = content[static_cast<size_t>(index)];
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) cellText += config_.cellSeparator;
                cellText += items[i];
            }
        }
        return content;
    }

    inline std::string CsvRenderer::renderAsString() {
        std::ostringstream out;
        CsvRowWriter writer(out);
        if (!renderTo(writer)) {
            throw Exception(Error(Errc::Unexpected, "failed to write rendered rows"));
        }
        return out.str();
    }

    inline bool CsvRenderer::renderTo(RowSink& sink) {
        for (const std::vector<std::string>& row : render()) {
            if (!sink.writeRow(row)) {
                return false;
            }
        }
        return sink.flush();
    }

} // namespace csvbind
