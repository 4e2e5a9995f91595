#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace solrank {

// One parsed line of a JSON-lines stream
struct JsonLine {
    Json::Value value;
    // Raw text of the line; Json::Value offsets point into it, which allows
    // recovering number literals verbatim
    std::string text;
    size_t line_no; // indexed from 1
};

/**
 * @brief Parses one JSON document; Infinity, -Infinity and NaN are accepted
 *
 * @errors Throws std::runtime_error describing the syntax error
 */
Json::Value parse_json(std::string_view text);

/**
 * @brief Returns the integer literal @p value was parsed from
 * @details The parser stores integers that do not fit in 64 bits as doubles.
 *   This recovers the exact literal from @p source_text, the document @p value
 *   was parsed from.
 *
 * @return std::nullopt if @p value is not a double parsed from an integer
 *   literal in @p source_text
 */
std::optional<std::string_view>
source_integer_literal(const Json::Value& value, std::string_view source_text) noexcept;

// Serializes @p value in a single line (without the trailing newline),
// non-finite floats are written as Infinity, -Infinity and NaN. Integer
// literals of any of @p source_texts (see source_integer_literal()) are
// written verbatim.
std::string
to_json_line(const Json::Value& value, const std::vector<std::string_view>& source_texts = {});

/**
 * @brief Reads a JSON-lines file, blank lines are skipped
 *
 * @errors Throws std::runtime_error if the file cannot be read or any line is
 *   not valid JSON (the message names the file and the line)
 */
std::vector<JsonLine> read_jsonl_file(const std::string& path);

/**
 * @brief Writes @p values to @p path, one per line (see to_json_line())
 *
 * @errors Throws std::runtime_error if the file cannot be written
 */
void write_jsonl_file(
    const std::string& path,
    const std::vector<Json::Value>& values,
    const std::vector<std::string_view>& source_texts = {}
);

} // namespace solrank
