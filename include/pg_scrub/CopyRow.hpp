#pragma once

#include "StrategyStructs.hpp"
#include <optional>
#include <string>
#include <vector>

class Strategies;
class Types;
class ValueTransformer;

/**
 * @brief The transformers bound to the COPY block being read, in COPY column order.
 *
 * transforms is std::nullopt when the table is truncated and its rows are dropped.
 */
struct CurrentTableTransforms
{
    std::string table_name;
    std::vector<std::string> columns;
    std::optional<std::vector<Transformer>> transforms;

    bool operator==(const CurrentTableTransforms &other) const
    {
        return table_name == other.table_name && columns == other.columns && transforms == other.transforms;
    }
};

class CopyRow
{
  public:
    struct Header
    {
        std::string table_name;
        std::vector<std::string> columns;
    };

    static std::optional<Header> parse_header(const std::string &line);
    static bool is_end(const std::string &line);

    /**
     * @brief Looks up the strategy for a COPY block. Every table with data must have one.
     *
     * Throws DumpParseError if the table or any of its COPY columns has no strategy.
     */
    static CurrentTableTransforms bind(const Header &header, const Strategies &strategies);

    /**
     * @brief Rewrites one data line of a COPY block.
     *
     * Returns std::nullopt when the row is dropped. Throws DumpParseError for a malformed row.
     */
    static std::optional<std::string> transform_row(const std::string &line,
                                                    const CurrentTableTransforms &current_table, const Types &types,
                                                    ValueTransformer &transformer);

  private:
    static void parse_columns(const std::string &raw_columns, std::vector<std::string> &columns);
};
