/*
 * Delimited CLI output parsing - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/exec/record_parser.hpp>
#include <cctype>
#include <sstream>

namespace dockstack {

static std::vector<std::string> split_exact(const std::string& line, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delim, start);
        if (pos == std::string::npos) { parts.push_back(line.substr(start)); break; }
        parts.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::variant<ParsedRecord, ParseError> parse_record(const std::string& line, const RecordSchema& schema,
                                                   std::size_t line_no) {
    auto parts = split_exact(line, schema.delimiter);
    if (parts.size() != schema.fields.size()) {
        return ParseError{line_no, line, "expected " + std::to_string(schema.fields.size()) + " fields, got "
                                         + std::to_string(parts.size())};
    }
    ParsedRecord rec;
    for (size_t i = 0; i < parts.size(); ++i) rec.emplace(schema.fields[i], std::move(parts[i]));
    return rec;
}

ParsedBatch parse_records(const std::string& text, const RecordSchema& schema) {
    ParsedBatch batch;
    std::istringstream in(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        bool blank = true;
        for (char c : line) if (!std::isspace(static_cast<unsigned char>(c))) { blank = false; break; }
        if (blank) continue;
        auto r = parse_record(line, schema, line_no);
        if (auto rec = std::get_if<ParsedRecord>(&r)) batch.records.push_back(std::move(*rec));
        else batch.errors.push_back(std::get<ParseError>(std::move(r)));
    }
    return batch;
}

} // namespace dockstack
