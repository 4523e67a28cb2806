/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <iostream>
#include <map>
#include <sstream>
#include "csvbind/csvbind.h"

struct Employee {
    std::string     name;
    int             age = 0;
    std::string     email;
    std::string     department;

    static void declareColumns(csvbind::Declaration<Employee>& d) {
        d.field("Name", "name", &Employee::name)
         .field("Age", "age", &Employee::age)
         .field("Email", "email", &Employee::email)
         .field("Department", "department,optional", &Employee::department);
    }
};

// Translations keyed by localization key or error message
static const std::map<std::string, std::string> kTexts = {
    {"name", "Name"},
    {"age", "Age"},
    {"email", "E-Mail"},
    {"ERR_NAME_LENGTH", "'{{.Value}}' in {{.ColumnHeader}} must have {{.MinLen}} to {{.MaxLen}} characters"},
    {"ERR_AGE_RANGE", "'{{.Value}}' in {{.ColumnHeader}} must be from {{.MinValue}} to {{.MaxValue}}"},
    {"ErrDecodeValueType", "'{{.Value}}' in {{.ColumnHeader}} is not a number"},
    {"ErrValidation: StrSuffix", "'{{.Value}}' in {{.ColumnHeader}} is not a company address"},
};

static std::optional<std::string> translate(const std::string& key, const csvbind::ParameterMap&) {
    auto it = kTexts.find(key);
    if (it == kTexts.end()) {
        return std::nullopt;
    }
    return it->second;
}

int main() {
    const std::string data =
        "name,age,email\n"
        "Alice,34,alice@example.com\n"
        "Bartholomew Maximilian,29,bart@example.com\n"
        "Carl,abc,carl@elsewhere.org\n"
        "Dana,17,dana@example.com\n";

    try {
        std::cout << "CSVBIND Error Report Example\n";
        std::cout << "============================\n\n";

        csvbind::DecodeConfig cfg;
        cfg.stopOnError = false;
        cfg.trimSpace = true;
        cfg.detectRowLine = true;

        auto& name = cfg.column("name");
        name.validators = {csvbind::validators::strLen(1, 12)};
        name.onCellError = [](csvbind::CellError& err) {
            err.setLocalizationKey("ERR_NAME_LENGTH");
            err.withParam("MinLen", 1).withParam("MaxLen", 12);
        };

        auto& age = cfg.column("age");
        age.validators = {csvbind::validators::range(18, 67)};
        age.onCellError = [](csvbind::CellError& err) {
            if (err.is(csvbind::Errc::ValidationRange)) {
                err.setLocalizationKey("ERR_AGE_RANGE");
                err.withParam("MinValue", 18).withParam("MaxValue", 67);
            }
        };

        cfg.column("email").validators = {csvbind::validators::strSuffix("@example.com")};

        std::istringstream input(data);
        csvbind::CsvRowReader reader(input);
        csvbind::Decoder decoder(reader, cfg);

        std::vector<Employee> employees;
        if (decoder.decode(employees)) {
            std::cout << "No errors in " << employees.size() << " rows\n";
            return 0;
        }
        const auto& result = decoder.finish();
        for (const auto& column : result.missingOptionalColumns()) {
            std::cout << "Optional column not present: " << column << "\n";
        }
        std::cout << "\n";

        // Plain text report
        csvbind::ErrorRenderConfig textCfg;
        textCfg.localizationFunc = translate;
        csvbind::SimpleRenderer text(decoder.errors(), textCfg);
        std::cout << text.render() << "\n\n";

        // Table report, one column per input column
        csvbind::CsvRenderConfig tableCfg;
        tableCfg.localizationFunc = translate;
        tableCfg.lineNumberColumn = -1;
        csvbind::CsvRenderer table(decoder.errors(), tableCfg);
        std::cout << table.renderAsString() << "\n";

        // Keys without translation fell back to their raw text
        for (const auto& err : table.translationErrors()) {
            std::cout << "untranslated: " << err.detail() << "\n";
        }
        return 0;
    } catch (const csvbind::Exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
