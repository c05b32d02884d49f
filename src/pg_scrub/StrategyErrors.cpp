#include "pg_scrub/StrategyErrors.hpp"

namespace
{
void print_columns(std::ostream &out, const std::string &heading, const std::vector<SimpleColumn> &columns)
{
    if (columns.empty())
        return;

    out << heading << ":\n";
    for (const auto &column : columns)
        out << "  - " << column << "\n";
}

void print_tables(std::ostream &out, const std::string &heading, const std::vector<std::string> &tables)
{
    if (tables.empty())
        return;

    out << heading << ":\n";
    for (const auto &table : tables)
        out << "  - " << table << "\n";
}
} // namespace

std::ostream &operator<<(std::ostream &out, const SimpleColumn &column)
{
    return out << column.table_name << "." << column.column_name;
}

std::ostream &operator<<(std::ostream &out, const ValidationErrors &errors)
{
    print_columns(out, "Columns containing PII with no anonymising transformer", errors.unanonymised_pii);
    print_columns(out, "Columns with an Unknown data category", errors.unknown_data_categories);
    print_columns(out, "Columns with an Error transformer", errors.error_transformer_types);
    print_columns(out, "Columns defined more than once", errors.duplicate_columns);
    print_tables(out, "Tables defined more than once", errors.duplicate_tables);
    return out;
}

std::ostream &operator<<(std::ostream &out, const DbErrors &errors)
{
    print_columns(out, "Columns in the database but missing from the strategy file", errors.missing_from_strategy_file);
    print_columns(out, "Columns in the strategy file but missing from the database", errors.missing_from_db);
    print_tables(out, "Truncated tables missing from the database", errors.truncated_tables_missing_from_db);
    return out;
}
