#pragma once

#include "Types.hpp"
#include <optional>
#include <string>

/**
 * @brief Pulls table names and column types out of pg_dump CREATE TABLE blocks.
 */
class CreateRow
{
  public:
    // Table name when @p line opens a CREATE TABLE block.
    static std::optional<std::string> parse_header(const std::string &line);

    static bool is_end(const std::string &line);

    /**
     * @brief Parses one line of a CREATE TABLE body.
     *
     * Returns std::nullopt for table constraints (CONSTRAINT, PRIMARY KEY, ...), which declare no
     * column. Throws DumpParseError when the line is not a column definition.
     */
    static std::optional<Column> parse_column(const std::string &line);

    static std::string unquote_identifier(const std::string &identifier);
    static std::string trim(const std::string &str);
};
