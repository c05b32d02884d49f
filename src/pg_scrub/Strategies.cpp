#include "pg_scrub/Strategies.hpp"

#include <algorithm>
#include <iterator>

namespace
{
SimpleColumn create_simple_column(const std::string &column_name, const std::string &table_name)
{
    return SimpleColumn{table_name, column_name};
}

bool is_pii(DataCategory data_category)
{
    return data_category == DataCategory::Pii || data_category == DataCategory::PotentialPii;
}
} // namespace

DbErrors compare_with_db(const std::set<SimpleColumn> &columns_from_strategy_file,
                         const std::set<std::string> &truncated_tables, const std::set<SimpleColumn> &columns_from_db)
{
    // Truncated tables have no per-column policy, so their live columns take no part in the diff.
    std::set<SimpleColumn> comparable_columns_from_db;
    std::set<std::string> tables_in_db;
    for (const auto &column : columns_from_db)
    {
        tables_in_db.insert(column.table_name);
        if (!truncated_tables.count(column.table_name))
            comparable_columns_from_db.insert(column);
    }

    DbErrors errors;
    std::set_difference(comparable_columns_from_db.begin(), comparable_columns_from_db.end(),
                        columns_from_strategy_file.begin(), columns_from_strategy_file.end(),
                        std::back_inserter(errors.missing_from_strategy_file));
    std::set_difference(columns_from_strategy_file.begin(), columns_from_strategy_file.end(),
                        comparable_columns_from_db.begin(), comparable_columns_from_db.end(),
                        std::back_inserter(errors.missing_from_db));
    std::set_difference(truncated_tables.begin(), truncated_tables.end(), tables_in_db.begin(), tables_in_db.end(),
                        std::back_inserter(errors.truncated_tables_missing_from_db));
    return errors;
}

Transformer apply_transformer_overrides(DataCategory data_category, const TransformerOverrides &overrides,
                                        const Transformer &transformer)
{
    if (data_category == DataCategory::PotentialPii && overrides.allow_potential_pii)
        return Transformer{TransformerType::Identity, std::nullopt};

    if (data_category == DataCategory::CommerciallySensitive && overrides.allow_commercially_sensitive)
        return Transformer{TransformerType::Identity, std::nullopt};

    if (overrides.scramble_blank && transformer.name == TransformerType::Scramble)
        return Transformer{TransformerType::ScrambleBlank, std::nullopt};

    return transformer;
}

ValidationErrors Strategies::from_strategies_in_file(const std::vector<StrategyInFile> &strategies_in_file,
                                                     const TransformerOverrides &overrides, Strategies &strategies)
{
    Strategies transformed;
    ValidationErrors errors;

    for (const auto &strategy : strategies_in_file)
    {
        // A repeated table is still checked column by column; only its first definition is kept.
        bool duplicate_table = transformed.tables_.count(strategy.table_name) > 0;
        if (duplicate_table)
            errors.duplicate_tables.push_back(strategy.table_name);

        ColumnStrategies columns;
        for (const auto &column : strategy.columns)
        {
            Transformer resolved = apply_transformer_overrides(column.data_category, overrides, column.transformer);
            bool demoted = column.data_category == DataCategory::PotentialPii && overrides.allow_potential_pii;

            if (is_pii(column.data_category) && resolved.name == TransformerType::Identity && !demoted)
                errors.unanonymised_pii.push_back(create_simple_column(column.name, strategy.table_name));

            if (column.data_category == DataCategory::Unknown)
                errors.unknown_data_categories.push_back(create_simple_column(column.name, strategy.table_name));

            if (column.transformer.name == TransformerType::Error)
                errors.error_transformer_types.push_back(create_simple_column(column.name, strategy.table_name));

            auto inserted = columns.emplace(column.name, ColumnInfo{column.name, column.data_category, resolved});
            if (!inserted.second)
                errors.duplicate_columns.push_back(create_simple_column(column.name, strategy.table_name));
        }

        if (duplicate_table)
            continue;

        if (strategy.truncate)
            transformed.insert_truncate(strategy.table_name);
        else
            transformed.insert(strategy.table_name, std::move(columns));
    }

    if (errors.is_empty())
        strategies = std::move(transformed);

    return errors;
}

DbErrors Strategies::validate_against_db(const std::set<SimpleColumn> &columns_from_db) const
{
    std::set<SimpleColumn> columns_from_strategy_file;
    std::set<std::string> truncated_tables;

    for (const auto &table : tables_)
    {
        if (const auto *columns = std::get_if<ColumnStrategies>(&table.second))
        {
            for (const auto &column : *columns)
                columns_from_strategy_file.insert(create_simple_column(column.first, table.first));
        }
        else
        {
            truncated_tables.insert(table.first);
        }
    }

    return compare_with_db(columns_from_strategy_file, truncated_tables, columns_from_db);
}

const TableStrategy *Strategies::for_table(const std::string &table_name) const
{
    auto it = tables_.find(table_name);
    if (it == tables_.end())
        return nullptr;
    return &it->second;
}

std::optional<Transformer> Strategies::transformer_for_column(const std::string &table_name,
                                                              const std::string &column_name) const
{
    const TableStrategy *table = for_table(table_name);
    if (!table)
        return std::nullopt;

    const auto *columns = std::get_if<ColumnStrategies>(table);
    if (!columns)
        return std::nullopt;

    auto it = columns->find(column_name);
    if (it == columns->end())
        return std::nullopt;
    return it->second.transformer;
}

bool Strategies::insert(const std::string &table_name, ColumnStrategies columns)
{
    return tables_.emplace(table_name, TableStrategy(std::move(columns))).second;
}

bool Strategies::insert_truncate(const std::string &table_name)
{
    return tables_.emplace(table_name, TableStrategy(Truncate{})).second;
}
