/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_decode_encode.cpp
 * @brief Micro-benchmarks for the row engines.
 *
 * Measures decoding and encoding of flat records and of records with a
 * dynamic inline group, with and without validators.
 */

#include <benchmark/benchmark.h>
#include <csvbind/csvbind.h>

#include <sstream>

using namespace csvbind;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

struct Trade {
    int64_t         id = 0;
    std::string     symbol;
    double          price = 0;
    uint32_t        quantity = 0;
    bool            buy = false;

    static void declareColumns(Declaration<Trade>& d) {
        d.field("ID", "id", &Trade::id)
         .field("Symbol", "symbol", &Trade::symbol)
         .field("Price", "price", &Trade::price)
         .field("Quantity", "quantity", &Trade::quantity)
         .field("Buy", "buy", &Trade::buy);
    }
};

struct Sensor {
    std::string             station;
    InlineColumns<double>   readings;

    static void declareColumns(Declaration<Sensor>& d) {
        d.field("Station", "station", &Sensor::station)
         .field("Readings", "readings,inline,prefix=ch", &Sensor::readings);
    }
};

std::vector<Trade> makeTrades(size_t count) {
    static const char* symbols[] = {"ABC", "XYZ", "LONGSYMBOL", "Q"};
    std::vector<Trade> trades(count);
    for (size_t i = 0; i < count; ++i) {
        trades[i].id       = static_cast<int64_t>(i);
        trades[i].symbol   = symbols[i % 4];
        trades[i].price    = 100.0 + static_cast<double>(i % 1000) * 0.25;
        trades[i].quantity = static_cast<uint32_t>((i * 7) % 5000);
        trades[i].buy      = (i % 3) == 0;
    }
    return trades;
}

std::vector<Sensor> makeSensors(size_t count, size_t channels) {
    std::vector<Sensor> sensors(count);
    for (size_t i = 0; i < count; ++i) {
        sensors[i].station = "S" + std::to_string(i % 50);
        for (size_t c = 0; c < channels; ++c) {
            sensors[i].readings.header.push_back(std::to_string(c));
            sensors[i].readings.values.push_back(static_cast<double>(i + c) * 0.5);
        }
    }
    return sensors;
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

static void BM_Encode_Flat(benchmark::State& state) {
    const auto trades = makeTrades(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        std::string text = marshal(trades);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Encode_Flat)->Arg(1000)->Arg(10000);

static void BM_Encode_Dynamic(benchmark::State& state) {
    const auto sensors = makeSensors(static_cast<size_t>(state.range(0)), 16);
    for (auto _ : state) {
        std::string text = marshal(sensors);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Encode_Dynamic)->Arg(1000)->Arg(10000);

// ============================================================================
// Decoding
// ============================================================================

static void BM_Decode_Flat(benchmark::State& state) {
    const std::string text = marshal(makeTrades(static_cast<size_t>(state.range(0))));
    for (auto _ : state) {
        std::vector<Trade> trades;
        Errors errors;
        bool ok = unmarshal(text, trades, errors);
        benchmark::DoNotOptimize(ok);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Decode_Flat)->Arg(1000)->Arg(10000);

static void BM_Decode_Validated(benchmark::State& state) {
    const std::string text = marshal(makeTrades(static_cast<size_t>(state.range(0))));
    DecodeConfig cfg;
    cfg.stopOnError = false;
    cfg.column("symbol").validators = {validators::strLen(1, 10)};
    cfg.column("quantity").validators = {validators::range(uint32_t{0}, uint32_t{10000})};
    cfg.column("price").preprocessors = {processors::trim};

    for (auto _ : state) {
        std::vector<Trade> trades;
        Errors errors;
        bool ok = unmarshal(text, trades, errors, cfg);
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Decode_Validated)->Arg(1000)->Arg(10000);

static void BM_Decode_Dynamic(benchmark::State& state) {
    const std::string text = marshal(makeSensors(static_cast<size_t>(state.range(0)), 16));
    for (auto _ : state) {
        std::vector<Sensor> sensors;
        Errors errors;
        bool ok = unmarshal(text, sensors, errors);
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Decode_Dynamic)->Arg(1000)->Arg(10000);

// Baseline: reader only, no record binding
static void BM_ReadRows_Baseline(benchmark::State& state) {
    const std::string text = marshal(makeTrades(static_cast<size_t>(state.range(0))));
    for (auto _ : state) {
        std::istringstream input(text);
        CsvRowReader reader(input);
        std::vector<std::string> fields;
        size_t rows = 0;
        while (reader.readRow(fields) == ReadStatus::OK) {
            ++rows;
        }
        benchmark::DoNotOptimize(rows);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ReadRows_Baseline)->Arg(1000)->Arg(10000);
