/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file errors_test.cpp
 * @brief Tests for the cell / row / document error model
 *
 * Tests cover:
 * - Error codes, category and messages
 * - Validation family matching
 * - Error counting on every level
 * - Identity queries recursing into the entries
 */

#include <gtest/gtest.h>
#include <csvbind/csvbind.h>

using csvbind::CellError;
using csvbind::Errc;
using csvbind::Error;
using csvbind::Errors;
using csvbind::RowErrors;

class ErrorsTest : public ::testing::Test {
protected:
    Errors errors_;

    // Two row errors with five cell errors and one structural error, plus one common error
    void SetUp() override {
        errors_.setTotalRow(100);
        errors_.setHeader({"Name", "Age", "Address"});

        RowErrors row1(10, 12);
        row1.add(CellError(Error(Errc::ValidationStrLen), 0, "Name"));
        row1.add(CellError(Error(Errc::ValidationRange), 1, "Age"));
        row1.add(CellError(Error(Errc::DecodeQuoteInvalid), csvbind::NO_COLUMN, ""));

        RowErrors row2(20, 22);
        row2.add(CellError(Error(Errc::ValidationStrLen), 0, "Name"));
        row2.add(CellError(Error(Errc::DecodeValueType, "int (abc)"), 1, "Age"));
        row2.add(Error(Errc::DecodeRowFieldCount, "row 20"));

        errors_.add(std::move(row1));
        errors_.add(std::move(row2));
        errors_.add(Error(Errc::TypeUnsupported));
    }
};

// Test 1: Default constructed Error means success
TEST(ErrorTest, DefaultIsSuccess) {
    Error err;
    EXPECT_FALSE(err);
    EXPECT_TRUE(Error(Errc::Unexpected));
}

// Test 2: Messages join code name and detail
TEST(ErrorTest, Message_CodeAndDetail) {
    EXPECT_EQ(Error(Errc::TypeUnsupported).message(), "ErrTypeUnsupported");
    EXPECT_EQ(Error(Errc::DecodeValueType, "int8 (300)").message(), "ErrDecodeValueType: int8 (300)");
    EXPECT_EQ(Error(Errc::ValidationRange).message(), "ErrValidation: Range");
    EXPECT_EQ(std::string(csvbind::errorCategory().name()), "csvbind");
}

// Test 3: Every Validation* code is a Validation error, nothing else is
TEST(ErrorTest, ValidationFamily) {
    for (Errc code : {Errc::ValidationLT, Errc::ValidationLTE, Errc::ValidationGT, Errc::ValidationGTE,
                      Errc::ValidationRange, Errc::ValidationIN, Errc::ValidationStrLen,
                      Errc::ValidationStrPrefix, Errc::ValidationStrSuffix}) {
        EXPECT_TRUE(Error(code).is(Errc::Validation)) << Error(code).message();
    }
    EXPECT_FALSE(Error(Errc::ValidationConversion).is(Errc::Validation));
    EXPECT_FALSE(Error(Errc::DecodeValueType).is(Errc::Validation));
    EXPECT_FALSE(Error(Errc::Validation).is(Errc::ValidationRange));
}

// Test 4: Foreign error codes keep their own identity
TEST(ErrorTest, ForeignErrorCode) {
    Error err(std::make_error_code(std::errc::invalid_argument), "bad input");
    EXPECT_TRUE(err);
    EXPECT_TRUE(err.is(std::make_error_code(std::errc::invalid_argument)));
    EXPECT_FALSE(err.is(Errc::Unexpected));
}

// Test 5: Exception carries the error
TEST(ErrorTest, Exception_CarriesError) {
    try {
        throw csvbind::Exception(Error(Errc::ConfigOptionInvalid, "column \"x\" not found"));
    } catch (const csvbind::Exception& ex) {
        EXPECT_TRUE(ex.is(Errc::ConfigOptionInvalid));
        EXPECT_STREQ(ex.what(), "ErrConfigOptionInvalid: column \"x\" not found");
        EXPECT_EQ(ex.error().detail(), "column \"x\" not found");
    }
}

// Test 6: Cell error attributes and parameters
TEST(ErrorTest, CellError_Attributes) {
    CellError cell(Error(Errc::ValidationStrLen), 3, "Name");
    cell.setValue("David David David");
    cell.setLocalizationKey("ERR_NAME_TOO_LONG");
    cell.withParam("MinLen", 1).withParam("MaxLen", 10).withParam("Unit", "chars");

    EXPECT_EQ(cell.column(), 3);
    EXPECT_EQ(cell.header(), "Name");
    EXPECT_EQ(cell.value(), "David David David");
    EXPECT_EQ(cell.localizationKey(), "ERR_NAME_TOO_LONG");
    EXPECT_EQ(cell.message(), "ErrValidation: StrLen");
    EXPECT_TRUE(cell.is(Errc::Validation));
    ASSERT_EQ(cell.params().size(), 3u);
    EXPECT_EQ(csvbind::paramToString(cell.params().at("MaxLen")), "10");
    EXPECT_EQ(csvbind::paramToString(cell.params().at("Unit")), "chars");
}

// Test 7: Counting on every level
TEST_F(ErrorsTest, Counts) {
    EXPECT_EQ(errors_.totalRow(), 100);
    EXPECT_EQ(errors_.totalRowError(), 2u);
    EXPECT_EQ(errors_.totalCellError(), 5u);
    EXPECT_EQ(errors_.totalError(), 7u);

    const auto& row2 = std::get<RowErrors>(errors_.entries()[1]);
    EXPECT_EQ(row2.row(), 20);
    EXPECT_EQ(row2.line(), 22);
    EXPECT_EQ(row2.totalCellError(), 2u);
    EXPECT_EQ(row2.totalError(), 3u);
}

// Test 8: Document counts are sums of the row counts
TEST_F(ErrorsTest, Counts_SumOfRows) {
    size_t cells = 0;
    size_t total = 0;
    for (const auto& entry : errors_.entries()) {
        if (const auto* row = std::get_if<RowErrors>(&entry)) {
            EXPECT_LE(row->totalCellError(), row->totalError());
            cells += row->totalCellError();
            total += row->totalError();
        } else {
            total += 1;
        }
    }
    EXPECT_EQ(cells, errors_.totalCellError());
    EXPECT_EQ(total, errors_.totalError());
}

// Test 9: Identity queries recurse to the causes
TEST_F(ErrorsTest, Is_Recursive) {
    EXPECT_TRUE(errors_.is(Errc::ValidationRange));
    EXPECT_TRUE(errors_.is(Errc::Validation));
    EXPECT_TRUE(errors_.is(Errc::DecodeRowFieldCount));
    EXPECT_TRUE(errors_.is(Errc::TypeUnsupported));
    EXPECT_FALSE(errors_.is(Errc::EncodeValueType));

    const auto& row1 = std::get<RowErrors>(errors_.entries()[0]);
    EXPECT_TRUE(row1.is(Errc::DecodeQuoteInvalid));
    EXPECT_FALSE(row1.is(Errc::DecodeValueType));
}

// Test 10: Messages join the entries
TEST_F(ErrorsTest, Message_Joined) {
    const auto& row2 = std::get<RowErrors>(errors_.entries()[1]);
    EXPECT_EQ(row2.message(),
              "ErrValidation: StrLen, ErrDecodeValueType: int (abc), ErrDecodeRowFieldCount: row 20");
    EXPECT_NE(errors_.message().find("ErrTypeUnsupported"), std::string::npos);
}

// Test 11: Empty collections
TEST(ErrorTest, Errors_Empty) {
    Errors errors;
    EXPECT_FALSE(errors.hasError());
    EXPECT_EQ(errors.totalError(), 0u);
    EXPECT_EQ(errors.totalRowError(), 0u);
    EXPECT_EQ(errors.message(), "");

    RowErrors row(2, csvbind::LINE_UNKNOWN);
    EXPECT_FALSE(row.hasError());
    EXPECT_EQ(row.line(), -1);
}

// Test 12: Errc converts implicitly to std::error_code in every context
TEST(ErrorTest, Errc_ConvertsToErrorCode) {
    static_assert(std::is_error_code_enum_v<Errc>);

    std::error_code code = Errc::DecodeValueType;
    EXPECT_TRUE(code.category() == csvbind::errorCategory());
    EXPECT_EQ(code, Errc::DecodeValueType);
    EXPECT_NE(code, Errc::EncodeValueType);

    CellError cell(Error(Errc::ValidationIN), 0, "Kind");
    EXPECT_TRUE(cell.is(Errc::ValidationIN));
    EXPECT_TRUE(cell.cause().is(std::error_code(Errc::ValidationIN)));
}
