/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "tag.h"

#include <vector>

namespace csvbind {

    namespace detail {

        inline std::vector<std::string_view> splitTokens(std::string_view text, char sep) {
            std::vector<std::string_view> tokens;
            size_t start = 0;
            for (size_t i = 0; i <= text.size(); ++i) {
                if (i == text.size() || text[i] == sep) {
                    tokens.push_back(text.substr(start, i - start));
                    start = i + 1;
                }
            }
            return tokens;
        }

    } // namespace detail

    inline Error parseTag(std::string_view fieldName, std::string_view tag, bool isPrivate, ColumnTag& out) {
        out = ColumnTag{};
        std::vector<std::string_view> tokens = detail::splitTokens(tag, ',');

        if (tokens.front() == "-") {
            out.ignored = true;
        } else if (tokens.front().empty()) {
            out.name = std::string(fieldName);
        } else {
            out.name = std::string(tokens.front());
        }

        constexpr std::string_view PREFIX_OPTION = "prefix=";
        for (size_t i = 1; i < tokens.size(); ++i) {
            std::string_view option = tokens[i];
            if (option == "optional") {
                out.optional = true;
            } else if (option == "omitempty") {
                out.omitEmpty = true;
            } else if (option == "inline") {
                out.inlined = true;
            } else if (option.substr(0, PREFIX_OPTION.size()) == PREFIX_OPTION) {
                out.prefix = std::string(option.substr(PREFIX_OPTION.size()));
            }
        }

        if (!out.ignored && isPrivate) {
            return Error(Errc::TagOptionInvalid, "field " + std::string(fieldName) + " is not public");
        }
        if (!out.prefix.empty() && !out.inlined) {
            return Error(Errc::TagOptionInvalid, "prefix is only accepted for inline column " + std::string(fieldName));
        }
        if (out.inlined && out.optional) {
            return Error(Errc::TagOptionInvalid, "inline column " + std::string(fieldName) + " must not be optional");
        }
        return {};
    }

} // namespace csvbind
