/*
 * Delimited CLI output parsing - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/event.hpp>
#include <string>
#include <variant>
#include <vector>

namespace dockstack {

struct RecordSchema {
    std::vector<std::string> fields;
    char delimiter = '|';
};

struct ParsedBatch {
    std::vector<ParsedRecord> records;
    std::vector<ParseError> errors;
};

// One line -> record, or a ParseError when the field count does not match.
std::variant<ParsedRecord, ParseError> parse_record(const std::string& line, const RecordSchema& schema,
                                                   std::size_t line_no = 1);

// Every non-blank line of `text`. Bad lines are collected, good ones kept.
ParsedBatch parse_records(const std::string& text, const RecordSchema& schema);

} // namespace dockstack
