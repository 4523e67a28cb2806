/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file csv_reader_writer_test.cpp
 * @brief Tests for CsvRowReader and CsvRowWriter
 *
 * Test categories:
 *   1. Reader: plain and quoted fields, line breaks, BOM, CRLF
 *   2. Reader: malformed records
 *   3. Writer: quoting rules and line endings
 *   4. Writer-to-reader round trip of awkward fields
 */

#include <gtest/gtest.h>
#include <csvbind/csvbind.h>

#include <sstream>

using csvbind::CsvRowReader;
using csvbind::CsvRowWriter;
using csvbind::ReadStatus;

using Fields = std::vector<std::string>;

// ============================================================================
// 1. Reader
// ============================================================================

// Test 1: Plain records with blank lines skipped
TEST(CsvReaderTest, Read_PlainRecords) {
    std::istringstream input("name,age\n\nAlice,30\nBob,\n");
    CsvRowReader reader(input);
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"name", "age"}));
    EXPECT_EQ(reader.sourceLine(), 1);

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"Alice", "30"}));
    EXPECT_EQ(reader.sourceLine(), 3);

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"Bob", ""}));

    EXPECT_EQ(reader.readRow(fields), ReadStatus::END);
    EXPECT_EQ(reader.rowCount(), 3u);
}

// Test 2: Quoted fields with delimiters, doubled quotes and line breaks
TEST(CsvReaderTest, Read_QuotedFields) {
    std::istringstream input("a,b\n\"Smith, J\",\"say \"\"hi\"\"\"\n\"multi\nline\",x\nlast,\"\"\n");
    CsvRowReader reader(input);
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"Smith, J", "say \"hi\""}));

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"multi\nline", "x"}));
    EXPECT_EQ(reader.sourceLine(), 3);

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"last", ""}));
    EXPECT_EQ(reader.sourceLine(), 5);
}

// Test 3: BOM and CRLF line endings are stripped
TEST(CsvReaderTest, Read_BomAndCrlf) {
    std::istringstream input("\xEF\xBB\xBFid;name\r\n1;x\r\n");
    CsvRowReader reader(input, ';');
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"id", "name"}));
    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"1", "x"}));
}

// Test 4: Empty input
TEST(CsvReaderTest, Read_EmptyInput) {
    std::istringstream input("");
    CsvRowReader reader(input);
    Fields fields;
    EXPECT_EQ(reader.readRow(fields), ReadStatus::END);
    EXPECT_TRUE(reader.getErrorMsg().empty());
}

// ============================================================================
// 2. Malformed records
// ============================================================================

// Test 5: The first record fixes the field count
TEST(CsvReaderTest, Read_FieldCount) {
    std::istringstream input("a,b\n1,2,3\n4,5\n");
    CsvRowReader reader(input);
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(reader.fieldsPerRecord(), 2);

    EXPECT_EQ(reader.readRow(fields), ReadStatus::FIELD_COUNT);
    EXPECT_EQ(fields.size(), 3u) << "fields of a malformed record are kept";
    EXPECT_FALSE(reader.getErrorMsg().empty());

    EXPECT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"4", "5"}));
}

// Test 6: Unchecked field count
TEST(CsvReaderTest, Read_FieldCountUnchecked) {
    std::istringstream input("a,b\n1,2,3\n");
    CsvRowReader reader(input);
    reader.setFieldsPerRecord(-1);
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields.size(), 3u);
}

// Test 7: Bare and extraneous quotes
TEST(CsvReaderTest, Read_InvalidQuotes) {
    std::istringstream input("a,b\nx\"y,1\n\"ok\"z,2\n3,4\n");
    CsvRowReader reader(input);
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(reader.readRow(fields), ReadStatus::QUOTE);
    EXPECT_NE(reader.getErrorMsg().find("bare"), std::string::npos);
    EXPECT_EQ(reader.readRow(fields), ReadStatus::QUOTE);
    EXPECT_NE(reader.getErrorMsg().find("extraneous"), std::string::npos);

    // Reading resumes after the malformed line
    EXPECT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(fields, (Fields{"3", "4"}));
}

// Test 8: Unterminated quoted field
TEST(CsvReaderTest, Read_UnterminatedQuote) {
    std::istringstream input("a,b\n\"open,1\n");
    CsvRowReader reader(input);
    Fields fields;

    ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
    EXPECT_EQ(reader.readRow(fields), ReadStatus::QUOTE);
    EXPECT_EQ(reader.readRow(fields), ReadStatus::END);
}

// ============================================================================
// 3. Writer
// ============================================================================

// Test 9: Quoting rules
TEST(CsvWriterTest, Write_Quoting) {
    std::ostringstream output;
    CsvRowWriter writer(output);

    EXPECT_FALSE(writer.fieldNeedsQuotes(""));
    EXPECT_FALSE(writer.fieldNeedsQuotes("plain text"));
    EXPECT_TRUE(writer.fieldNeedsQuotes("a,b"));
    EXPECT_TRUE(writer.fieldNeedsQuotes("say \"hi\""));
    EXPECT_TRUE(writer.fieldNeedsQuotes("two\nlines"));
    EXPECT_TRUE(writer.fieldNeedsQuotes(" leading"));
    EXPECT_TRUE(writer.fieldNeedsQuotes("\\."));
    EXPECT_FALSE(writer.fieldNeedsQuotes("trailing "));

    ASSERT_TRUE(writer.writeRow({"Smith, J", "say \"hi\"", "", "42"}));
    ASSERT_TRUE(writer.flush());
    EXPECT_EQ(output.str(), "\"Smith, J\",\"say \"\"hi\"\"\",,42\n");
    EXPECT_EQ(writer.rowCount(), 1u);
}

// Test 10: Custom delimiter and CRLF
TEST(CsvWriterTest, Write_DelimiterAndCrlf) {
    std::ostringstream output;
    CsvRowWriter writer(output, '\t', true);

    ASSERT_TRUE(writer.writeRow({"a", "b,c"}));
    ASSERT_TRUE(writer.writeRow({"x\ty", "z"}));
    EXPECT_EQ(output.str(), "a\tb,c\r\n\"x\ty\"\tz\r\n");
}

// Test 11: Stream failure is reported
TEST(CsvWriterTest, Write_StreamFailure) {
    std::ostringstream output;
    output.setstate(std::ios::badbit);
    CsvRowWriter writer(output);

    EXPECT_FALSE(writer.writeRow({"a"}));
    EXPECT_FALSE(writer.getErrorMsg().empty());
    EXPECT_EQ(writer.rowCount(), 0u);
}

// ============================================================================
// 4. Round trip
// ============================================================================

// Test 12: Awkward fields survive writer and reader
TEST(CsvReaderWriterTest, RoundTrip_AwkwardFields) {
    const std::vector<Fields> rows = {
        {"id", "text"},
        {"1", "comma, inside"},
        {"2", "\"quoted\""},
        {"3", "multi\nline"},
        {"4", "  padded  "},
        {"5", ""},
    };

    std::ostringstream output;
    CsvRowWriter writer(output);
    for (const Fields& row : rows) {
        ASSERT_TRUE(writer.writeRow(row));
    }

    std::istringstream input(output.str());
    CsvRowReader reader(input);
    Fields fields;
    for (const Fields& row : rows) {
        ASSERT_EQ(reader.readRow(fields), ReadStatus::OK);
        EXPECT_EQ(fields, row);
    }
    EXPECT_EQ(reader.readRow(fields), ReadStatus::END);
}
