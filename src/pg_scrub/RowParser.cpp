#include "pg_scrub/RowParser.hpp"
#include "pg_scrub/CopyRow.hpp"
#include "pg_scrub/CreateRow.hpp"

RowParser::RowParser(const Strategies &strategies, ValueTransformer &transformer)
    : strategies_(strategies), transformer_(transformer)
{
}

std::optional<std::string> RowParser::parse(const std::string &line)
{
    if (auto *create_table = std::get_if<InCreateTable>(&state_.position))
    {
        if (CreateRow::is_end(line))
        {
            state_.update_position(Normal{});
        }
        else if (auto column = CreateRow::parse_column(line))
        {
            create_table->types.push_back(*column);
        }
        return line;
    }

    if (const auto *copy = std::get_if<InCopy>(&state_.position))
    {
        if (CopyRow::is_end(line))
        {
            state_.update_position(Normal{});
            return line;
        }

        std::optional<std::string> row = CopyRow::transform_row(line, copy->current_table, state_.types, transformer_);
        if (row)
            rows_transformed_++;
        else
            rows_dropped_++;
        return row;
    }

    if (auto table_name = CreateRow::parse_header(line))
    {
        state_.update_position(InCreateTable{*table_name, {}});
    }
    else if (auto header = CopyRow::parse_header(line))
    {
        state_.update_position(InCopy{CopyRow::bind(*header, strategies_)});
    }
    return line;
}
