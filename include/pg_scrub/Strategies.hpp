#pragma once

#include "StrategyErrors.hpp"
#include "StrategyStructs.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

using ColumnStrategies = std::map<std::string, ColumnInfo>;

// All rows of the table are dropped from the output.
struct Truncate
{
    bool operator==(const Truncate &) const
    {
        return true;
    }
};

using TableStrategy = std::variant<ColumnStrategies, Truncate>;

/**
 * @brief Resolves the transformer a column actually gets once the override flags are applied.
 *
 * Category overrides are checked before the scramble override, so an allowed category always
 * ends up as Identity even when scramble_blank is also set.
 */
Transformer apply_transformer_overrides(DataCategory data_category, const TransformerOverrides &overrides,
                                        const Transformer &transformer);

/**
 * @brief Diffs the columns a strategy covers against the columns that really exist.
 *
 * Live columns of truncated tables are left out; a truncated table absent from the live schema is
 * reported on its own. Every list in the result is sorted.
 */
DbErrors compare_with_db(const std::set<SimpleColumn> &columns_from_strategy_file,
                         const std::set<std::string> &truncated_tables, const std::set<SimpleColumn> &columns_from_db);

/**
 * @brief The compiled, validated strategy for every table in the dump. Read only once built.
 */
class Strategies
{
  public:
    Strategies() = default;

    /**
     * @brief Compiles the entries of a strategy document.
     *
     * Never stops at the first problem: every error found is added to the returned batch.
     * @p strategies is only filled in when the returned batch is empty.
     */
    static ValidationErrors from_strategies_in_file(const std::vector<StrategyInFile> &strategies_in_file,
                                                    const TransformerOverrides &overrides, Strategies &strategies);

    /**
     * @brief Diffs the strategy's columns against the columns that really exist.
     */
    DbErrors validate_against_db(const std::set<SimpleColumn> &columns_from_db) const;

    const TableStrategy *for_table(const std::string &table_name) const;
    std::optional<Transformer> transformer_for_column(const std::string &table_name,
                                                      const std::string &column_name) const;

    bool insert(const std::string &table_name, ColumnStrategies columns);
    bool insert_truncate(const std::string &table_name);

    const std::map<std::string, TableStrategy> &tables() const
    {
        return tables_;
    }

    bool operator==(const Strategies &other) const
    {
        return tables_ == other.tables_;
    }

  private:
    std::map<std::string, TableStrategy> tables_;
};
