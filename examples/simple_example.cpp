/*
 * Copyright (c) 2026 The CSVBIND Authors
 *
 * This file is part of the CSVBIND library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <iostream>
#include <sstream>
#include "csvbind/csvbind.h"

struct Student {
    std::string                     name;
    int                             age = 0;
    std::optional<double>           grade;
    csvbind::InlineColumns<int>     scores;

    static void declareColumns(csvbind::Declaration<Student>& d) {
        d.field("Name", "name", &Student::name)
         .field("Age", "age", &Student::age)
         .field("Grade", "grade,omitempty", &Student::grade)
         .field("Scores", "scores,inline,prefix=score_", &Student::scores);
    }
};

int main() {
    try {
        std::cout << "CSVBIND Simple Example\n";
        std::cout << "======================\n\n";

        // Describe the expected columns
        std::cout << "Columns of Student:\n";
        for (const auto& detail : csvbind::getHeaderDetails<Student>()) {
            std::cout << "  " << detail.name << " (" << detail.typeName << ")"
                      << (detail.inlined ? " inline" : "") << "\n";
        }
        std::cout << "\n";

        // Write some records
        std::vector<Student> students(2);
        students[0] = {"Alice", 17, 1.3, {{"math", "physics"}, {92, 88}}};
        students[1] = {"Bob", 16, std::nullopt, {{"math", "physics"}, {71, 64}}};

        std::ostringstream output;
        csvbind::CsvRowWriter writer(output);
        csvbind::Encoder encoder(writer);
        encoder.encode(students);
        encoder.finish();

        std::cout << "Encoded " << encoder.rowCount() << " rows:\n" << output.str() << "\n";

        // Read them back
        std::istringstream input(output.str());
        csvbind::CsvRowReader reader(input);
        csvbind::Decoder decoder(reader);

        std::vector<Student> decoded;
        if (!decoder.decode(decoded)) {
            std::cerr << decoder.errors().message() << "\n";
            return 1;
        }
        const auto& result = decoder.finish();

        std::cout << "Decoded " << decoded.size() << " of " << result.totalRow() << " rows:\n";
        for (const Student& student : decoded) {
            std::cout << "  " << student.name << ", " << student.age;
            if (student.grade) {
                std::cout << ", grade " << *student.grade;
            }
            for (size_t i = 0; i < student.scores.values.size(); ++i) {
                std::cout << ", " << student.scores.header[i] << "=" << student.scores.values[i];
            }
            std::cout << "\n";
        }
        return 0;
    } catch (const csvbind::Exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
