/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file inline_column_test.cpp
 * @brief Tests for fixed and dynamic inline groups in the row engines
 */

#include <gtest/gtest.h>
#include <csvbind/csvbind.h>

#include <sstream>

using csvbind::CellError;
using csvbind::CsvRowReader;
using csvbind::DecodeConfig;
using csvbind::Decoder;
using csvbind::Declaration;
using csvbind::EncodeConfig;
using csvbind::Encoder;
using csvbind::Errc;
using csvbind::Errors;
using csvbind::InlineColumns;
using csvbind::MemoryRowSink;
using csvbind::RowErrors;

namespace {

    struct Sample {
        std::string         name;
        InlineColumns<int>  scores;
        std::string         note;

        static void declareColumns(Declaration<Sample>& d) {
            d.field("Name", "name", &Sample::name)
             .field("Scores", "scores,inline,prefix=s_", &Sample::scores)
             .field("Note", "note,optional", &Sample::note);
        }
    };

    struct Money {
        double      amount = 0;
        std::string currency;

        static void declareColumns(Declaration<Money>& d) {
            d.field("Amount", "amount", &Money::amount)
             .field("Currency", "currency", &Money::currency);
        }
    };

    struct Invoice {
        std::string id;
        Money       net;
        Money       gross;

        static void declareColumns(Declaration<Invoice>& d) {
            d.field("ID", "id", &Invoice::id)
             .field("Net", "net,inline,prefix=net_", &Invoice::net)
             .field("Gross", "gross,inline,prefix=gross_", &Invoice::gross);
        }
    };

} // namespace

// Test 1: Dynamic group takes its columns from the live header
TEST(InlineColumnTest, Dynamic_Decode) {
    std::istringstream input("name,s_math,s_art,note\nAlice,90,75,ok\nBob,60,,\n");
    CsvRowReader reader(input);
    DecodeConfig cfg;
    cfg.stopOnError = false;
    Decoder decoder(reader, cfg);

    std::vector<Sample> samples;
    EXPECT_FALSE(decoder.decode(samples));

    // Bob's empty art score is the only failure
    const Errors& errors = decoder.errors();
    ASSERT_EQ(errors.totalCellError(), 1u);
    const auto& cell = std::get<CellError>(std::get<RowErrors>(errors.entries()[0]).entries()[0]);
    EXPECT_EQ(cell.column(), 2);
    EXPECT_EQ(cell.header(), "s_art");
    EXPECT_TRUE(cell.is(Errc::DecodeValueType));
}

// Test 2: Group configuration applies to every column of the group
TEST(InlineColumnTest, Dynamic_GroupConfig) {
    std::istringstream input("name,s_math,s_art\nAlice, 90 ,75\n");
    CsvRowReader reader(input);
    DecodeConfig cfg;
    cfg.column("scores").trimSpace = true;
    cfg.column("scores").validators = {csvbind::validators::range(0, 100)};
    Decoder decoder(reader, cfg);

    std::vector<Sample> samples;
    ASSERT_TRUE(decoder.decode(samples));
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].scores.header, (std::vector<std::string>{"math", "art"}));
    EXPECT_EQ(samples[0].scores.values, (std::vector<int>{90, 75}));
    EXPECT_TRUE(samples[0].note.empty());
}

// Test 3: Encoding takes the group width from the first row
TEST(InlineColumnTest, Dynamic_Encode) {
    MemoryRowSink sink;
    Encoder encoder(sink);

    std::vector<Sample> samples(2);
    samples[0] = {"Alice", {{"math", "art"}, {90, 75}}, "ok"};
    samples[1] = {"Bob", {{"math", "art"}, {60, 0}}, ""};
    encoder.encode(samples);

    ASSERT_EQ(sink.rows().size(), 3u);
    EXPECT_EQ(sink.rows()[0], (std::vector<std::string>{"name", "s_math", "s_art", "note"}));
    EXPECT_EQ(sink.rows()[2], (std::vector<std::string>{"Bob", "60", "0", ""}));
}

// Test 4: A row with fewer group values than the header fails
TEST(InlineColumnTest, Dynamic_EncodeShortRow) {
    MemoryRowSink sink;
    Encoder encoder(sink);

    std::vector<Sample> samples(2);
    samples[0] = {"Alice", {{"math", "art"}, {90, 75}}, ""};
    samples[1] = {"Bob", {{"math"}, {60}}, ""};
    try {
        encoder.encode(samples);
        FAIL() << "short group must throw";
    } catch (const csvbind::Exception& ex) {
        EXPECT_TRUE(ex.is(Errc::EncodeValueType));
        EXPECT_NE(ex.error().detail().find("s_art"), std::string::npos);
    }
    EXPECT_EQ(encoder.rowCount(), 1u);
}

// Test 5: Single expanded columns can be configured by their key
TEST(InlineColumnTest, Dynamic_EncodeColumnConfig) {
    MemoryRowSink sink;
    EncodeConfig cfg;
    cfg.column("s_art").skip = true;
    cfg.column("scores").postprocessors = {[](std::string_view s) { return std::string(s) + "%"; }};
    Encoder encoder(sink, cfg);

    encoder.encode(std::vector<Sample>{{"Alice", {{"math", "art", "music"}, {90, 75, 80}}, ""}});
    EXPECT_EQ(sink.rows()[0], (std::vector<std::string>{"name", "s_math", "s_music", "note"}));
    EXPECT_EQ(sink.rows()[1], (std::vector<std::string>{"Alice", "90%", "80%", ""}));
}

// Test 6: Dynamic groups round trip
TEST(InlineColumnTest, Dynamic_RoundTrip) {
    std::vector<Sample> samples = {
        {"Alice", {{"math", "art"}, {90, 75}}, "top"},
        {"Bob", {{"math", "art"}, {60, 55}}, ""},
    };
    std::string text = csvbind::marshal(samples);
    EXPECT_EQ(text, "name,s_math,s_art,note\nAlice,90,75,top\nBob,60,55,\n");

    std::vector<Sample> decoded;
    Errors errors;
    ASSERT_TRUE(csvbind::unmarshal(text, decoded, errors)) << errors.message();
    EXPECT_EQ(decoded[0].scores, samples[0].scores);
    EXPECT_EQ(decoded[1].scores, samples[1].scores);
}

// Test 7: Fixed groups round trip with prefixed columns
TEST(InlineColumnTest, Fixed_RoundTrip) {
    std::vector<Invoice> invoices = {
        {"INV-1", {100.5, "EUR"}, {119.6, "EUR"}},
    };
    std::string text = csvbind::marshal(invoices);
    EXPECT_EQ(text, "id,net_amount,net_currency,gross_amount,gross_currency\nINV-1,100.5,EUR,119.6,EUR\n");

    std::vector<Invoice> decoded;
    Errors errors;
    ASSERT_TRUE(csvbind::unmarshal(text, decoded, errors));
    EXPECT_DOUBLE_EQ(decoded[0].gross.amount, 119.6);
    EXPECT_EQ(decoded[0].net.currency, "EUR");
}

// Test 8: Group configuration of a fixed group
TEST(InlineColumnTest, Fixed_GroupConfig) {
    DecodeConfig cfg;
    cfg.stopOnError = false;
    cfg.column("gross").validators = {csvbind::validators::gt(0.0)};
    cfg.column("gross_currency").validators = {csvbind::validators::in({"EUR", "USD"})};

    std::vector<Invoice> decoded;
    Errors errors;
    EXPECT_FALSE(csvbind::unmarshal("id,net_amount,net_currency,gross_amount,gross_currency\nA,1,EUR,-1,GBP\n",
                                    decoded, errors, cfg));
    const auto& row = std::get<RowErrors>(errors.entries()[0]);
    ASSERT_EQ(row.totalCellError(), 2u);
    EXPECT_TRUE(std::get<CellError>(row.entries()[0]).is(Errc::ValidationGT));
    EXPECT_TRUE(std::get<CellError>(row.entries()[1]).is(Errc::ValidationIN));
}
