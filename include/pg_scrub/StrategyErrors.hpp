#pragma once

#include "StrategyStructs.hpp"
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Everything wrong with a strategy document, collected in one pass.
 */
struct ValidationErrors
{
    std::vector<SimpleColumn> unanonymised_pii;
    std::vector<SimpleColumn> unknown_data_categories;
    std::vector<SimpleColumn> error_transformer_types;
    std::vector<SimpleColumn> duplicate_columns;
    std::vector<std::string> duplicate_tables;

    bool is_empty() const
    {
        return unanonymised_pii.empty() && unknown_data_categories.empty() && error_transformer_types.empty() &&
               duplicate_columns.empty() && duplicate_tables.empty();
    }
};

/**
 * @brief Differences between the strategy file and the live schema. Every list is sorted.
 */
struct DbErrors
{
    std::vector<SimpleColumn> missing_from_strategy_file;
    std::vector<SimpleColumn> missing_from_db;
    std::vector<std::string> truncated_tables_missing_from_db;

    bool is_empty() const
    {
        return missing_from_strategy_file.empty() && missing_from_db.empty() &&
               truncated_tables_missing_from_db.empty();
    }
};

std::ostream &operator<<(std::ostream &out, const SimpleColumn &column);
std::ostream &operator<<(std::ostream &out, const ValidationErrors &errors);
std::ostream &operator<<(std::ostream &out, const DbErrors &errors);
