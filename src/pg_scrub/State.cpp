#include "pg_scrub/State.hpp"

void State::update_position(Position new_position)
{
    const auto *create_table = std::get_if<InCreateTable>(&position);
    if (create_table && std::holds_alternative<Normal>(new_position))
    {
        TableTypes columns;
        for (const auto &column : create_table->types)
            columns[column.name] = column.data_type;
        types.insert(create_table->table_name, std::move(columns));
    }

    position = std::move(new_position);
}
