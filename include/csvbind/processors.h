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
 * @file processors.h
 * @brief Text processors applied to cell text before decoding or after encoding.
 *
 * The single argument processors (trim, lower, upper, numberGroupComma,
 * numberUngroupComma) match ProcessorFunc directly, the others are bound in a
 * lambda:
 *
 *     cfg.column("price").preprocessors = {
 *         csvbind::processors::trim,
 *         [](std::string_view s) { return csvbind::processors::trimPrefix(s, "$"); },
 *         csvbind::processors::numberUngroupComma,
 *     };
 *
 * Case mapping and whitespace trimming work on ASCII characters.
 */

#include <cctype>
#include <string>
#include <string_view>

namespace csvbind::processors {

    namespace detail {

        inline bool isSpace(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        inline bool isDigit(char c) {
            return c >= '0' && c <= '9';
        }

    } // namespace detail

    inline std::string trim(std::string_view s) {
        while (!s.empty() && detail::isSpace(s.front())) s.remove_prefix(1);
        while (!s.empty() && detail::isSpace(s.back())) s.remove_suffix(1);
        return std::string(s);
    }

    inline std::string trimPrefix(std::string_view s, std::string_view prefix) {
        if (s.substr(0, prefix.size()) == prefix) {
            s.remove_prefix(prefix.size());
        }
        return std::string(s);
    }

    inline std::string trimSuffix(std::string_view s, std::string_view suffix) {
        if (s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix) {
            s.remove_suffix(suffix.size());
        }
        return std::string(s);
    }

    // Replace the first n occurrences of from, every occurrence when n < 0
    inline std::string replace(std::string_view s, std::string_view from, std::string_view to, int n) {
        if (from.empty() || n == 0) {
            return std::string(s);
        }
        std::string out;
        out.reserve(s.size());
        size_t pos = 0;
        int replaced = 0;
        while (n < 0 || replaced < n) {
            size_t hit = s.find(from, pos);
            if (hit == std::string_view::npos) {
                break;
            }
            out.append(s.substr(pos, hit - pos));
            out.append(to);
            pos = hit + from.size();
            replaced++;
        }
        out.append(s.substr(pos));
        return out;
    }

    inline std::string replaceAll(std::string_view s, std::string_view from, std::string_view to) {
        return replace(s, from, to, -1);
    }

    inline std::string lower(std::string_view s) {
        std::string out(s);
        for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    inline std::string upper(std::string_view s) {
        std::string out(s);
        for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return out;
    }

    /**
     * @brief Insert groupSep between every three integer digits of a number.
     * Text that is not [+-]digits[fractionSep digits] is returned unchanged.
     */
    inline std::string numberGroup(std::string_view s, char fractionSep, char groupSep) {
        size_t start = (!s.empty() && (s.front() == '+' || s.front() == '-')) ? 1 : 0;
        size_t intEnd = start;
        while (intEnd < s.size() && detail::isDigit(s[intEnd])) intEnd++;
        if (intEnd == start) {
            return std::string(s);
        }
        if (intEnd < s.size()) {
            if (s[intEnd] != fractionSep || intEnd + 1 == s.size()) {
                return std::string(s);
            }
            for (size_t i = intEnd + 1; i < s.size(); ++i) {
                if (!detail::isDigit(s[i])) {
                    return std::string(s);
                }
            }
        }

        const size_t digits = intEnd - start;
        std::string out;
        out.reserve(s.size() + digits / 3);
        out.append(s.substr(0, start));
        for (size_t i = 0; i < digits; ++i) {
            if (i > 0 && (digits - i) % 3 == 0) {
                out.push_back(groupSep);
            }
            out.push_back(s[start + i]);
        }
        out.append(s.substr(intEnd));
        return out;
    }

    inline std::string numberUngroup(std::string_view s, char groupSep) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c != groupSep) out.push_back(c);
        }
        return out;
    }

    inline std::string numberGroupComma(std::string_view s) {
        return numberGroup(s, '.', ',');
    }

    inline std::string numberUngroupComma(std::string_view s) {
        return numberUngroup(s, ',');
    }

} // namespace csvbind::processors
