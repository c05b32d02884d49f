#pragma once

#include "CopyRow.hpp"
#include "Types.hpp"
#include <string>
#include <variant>
#include <vector>

struct Normal
{
    bool operator==(const Normal &) const
    {
        return true;
    }
};

struct InCreateTable
{
    std::string table_name;
    std::vector<Column> types;

    bool operator==(const InCreateTable &other) const
    {
        return table_name == other.table_name && types == other.types;
    }
};

struct InCopy
{
    CurrentTableTransforms current_table;

    bool operator==(const InCopy &other) const
    {
        return current_table == other.current_table;
    }
};

using Position = std::variant<Normal, InCreateTable, InCopy>;

/**
 * @brief Where the parser is within the dump, plus the column types collected so far.
 *
 * Owned by a single run and thrown away at the end of it.
 */
class State
{
  public:
    Position position = Normal{};
    Types types;

    /**
     * @brief Moves to @p new_position. Leaving a CREATE TABLE block commits its column types.
     */
    void update_position(Position new_position);
};
