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
 * @file tag.h
 * @brief Column tag grammar.
 *
 * A tag is a comma separated token list attached to a declared field:
 *     <key>[,optional][,omitempty][,inline][,prefix=<p>]
 * The key "-" ignores the field, an empty key falls back to the field name.
 * Unknown options are ignored.
 */

#include <string>
#include <string_view>

#include "errors.h"

namespace csvbind {

    struct ColumnTag {
        std::string             name;               // column key
        std::string             prefix;             // key prefix of inline group members
        bool                    ignored   = false;
        bool                    optional  = false;
        bool                    omitEmpty = false;
        bool                    inlined   = false;
    };

    Error parseTag(std::string_view fieldName, std::string_view tag, bool isPrivate, ColumnTag& out);

} // namespace csvbind
