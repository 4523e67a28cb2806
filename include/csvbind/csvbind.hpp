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
 * @file csvbind.hpp
 * @brief CSVBIND Library - Convenience entry points over the CSV adapters
 */

#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "decoder.hpp"
#include "encoder.hpp"

#include <sstream>

namespace csvbind {

    template<RecordType T>
    bool unmarshal(std::string_view csv, std::vector<T>& out, Errors& errors, const DecodeConfig& config) {
        std::istringstream input{std::string(csv)};
        CsvRowReader reader(input);
        Decoder decoder(reader, config);
        bool ok = decoder.decode(out);
        decoder.finish();
        errors = decoder.errors();
        return ok;
    }

    template<RecordType T>
    std::string marshal(const std::vector<T>& rows, const EncodeConfig& config) {
        std::ostringstream output;
        CsvRowWriter writer(output);
        Encoder encoder(writer, config);
        encoder.encode(rows);
        encoder.finish();
        return output.str();
    }

} // namespace csvbind
