#pragma once

#include <optional>
#include <string>
#include <vector>

// std::nullopt is SQL NULL.
using FieldValue = std::optional<std::string>;

/**
 * @brief Reads and writes rows in the COPY text format used by pg_dump.
 *
 * Fields are TAB separated, NULL is written as \N and only the escapes pg_dump itself emits
 * (\\ \b \f \n \r \t \v) are accepted. Encoding always escapes control characters, so a field
 * holding a raw control byte does not survive decode then encode unchanged. Callers that must
 * reproduce a field exactly keep its raw text from split_row.
 */
class RowCodec
{
  public:
    static constexpr char DELIMITER = '\t';
    static constexpr const char *NULL_MARKER = "\\N";

    // The undecoded text of each field.
    static std::vector<std::string> split_row(const std::string &line);
    static std::string join_row(const std::vector<std::string> &raw_fields);

    static std::vector<FieldValue> decode_row(const std::string &line);
    static std::string encode_row(const std::vector<FieldValue> &fields);

    static FieldValue decode_field(const std::string &raw);
    static std::string encode_field(const FieldValue &value);
};
