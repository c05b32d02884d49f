#include "pg_scrub/StrategyFile.hpp"
#include "pg_scrub/Strategies.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>

namespace
{
std::string required_string(const YAML::Node &node, const std::string &key, const std::string &what)
{
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar())
        throw StrategyFileError(what + " is missing a '" + key + "' entry");
    return value.as<std::string>();
}

std::string optional_string(const YAML::Node &node, const std::string &key)
{
    const YAML::Node value = node[key];
    if (!value || value.IsNull())
        return "";
    return value.as<std::string>();
}

Transformer parse_transformer(const YAML::Node &node, const std::string &column)
{
    Transformer transformer;
    if (!node)
        return transformer;
    if (!node.IsMap())
        throw StrategyFileError("The transformer of column " + column + " must be a map");

    transformer.name = parse_transformer_type(optional_string(node, "name"));

    const YAML::Node args = node["args"];
    if (args && !args.IsNull())
    {
        if (!args.IsMap())
            throw StrategyFileError("The transformer args of column " + column + " must be a map");

        TransformerArgs parsed_args;
        for (auto it = args.begin(); it != args.end(); ++it)
            parsed_args[it->first.as<std::string>()] = it->second.as<std::string>();
        transformer.args = parsed_args;
    }
    return transformer;
}

ColumnInFile parse_column(const YAML::Node &node, const std::string &table_name)
{
    if (!node.IsMap())
        throw StrategyFileError("Every column of table " + table_name + " must be a map");

    ColumnInFile column;
    column.name = required_string(node, "name", "A column of table " + table_name);
    column.description = optional_string(node, "description");
    column.data_category = parse_data_category(optional_string(node, "data_category"));
    column.transformer = parse_transformer(node["transformer"], table_name + "." + column.name);
    return column;
}

void emit_column(YAML::Emitter &out, const ColumnInFile &column)
{
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << column.name;
    out << YAML::Key << "description" << YAML::Value << column.description;
    out << YAML::Key << "data_category" << YAML::Value << to_string(column.data_category);
    out << YAML::Key << "transformer" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << to_string(column.transformer.name);
    if (column.transformer.args)
    {
        out << YAML::Key << "args" << YAML::Value << YAML::BeginMap;
        for (const auto &arg : *column.transformer.args)
            out << YAML::Key << arg.first << YAML::Value << arg.second;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
}

ColumnInFile column_for_review(const std::string &name)
{
    return ColumnInFile{name, "", DataCategory::Unknown, Transformer{TransformerType::Error, std::nullopt}};
}
} // namespace

std::vector<StrategyInFile> StrategyFile::read(const std::string &path)
{
    try
    {
        return parse(YAML::LoadFile(path));
    }
    catch (const YAML::Exception &e)
    {
        throw StrategyFileError("Could not read strategy file " + path + ": " + e.what());
    }
}

std::vector<StrategyInFile> StrategyFile::parse(const YAML::Node &root)
{
    if (!root || !root.IsSequence())
        throw StrategyFileError("A strategy file must be a list of tables");

    std::vector<StrategyInFile> strategies;
    try
    {
        for (const auto &entry : root)
        {
            if (!entry.IsMap())
                throw StrategyFileError("Every entry of a strategy file must be a map");

            StrategyInFile strategy;
            strategy.table_name = required_string(entry, "table_name", "A table entry");
            strategy.description = optional_string(entry, "description");
            if (entry["truncate"])
                strategy.truncate = entry["truncate"].as<bool>();

            const YAML::Node columns = entry["columns"];
            if (columns && !columns.IsNull())
            {
                if (!columns.IsSequence())
                    throw StrategyFileError("The columns of table " + strategy.table_name + " must be a list");
                for (const auto &column : columns)
                    strategy.columns.push_back(parse_column(column, strategy.table_name));
            }
            strategies.push_back(std::move(strategy));
        }
    }
    catch (const YAML::Exception &e)
    {
        throw StrategyFileError(std::string("Invalid strategy file: ") + e.what());
    }
    return strategies;
}

std::string StrategyFile::emit(const std::vector<StrategyInFile> &strategies)
{
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto &strategy : strategies)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "table_name" << YAML::Value << strategy.table_name;
        out << YAML::Key << "description" << YAML::Value << strategy.description;
        out << YAML::Key << "truncate" << YAML::Value << strategy.truncate;
        out << YAML::Key << "columns" << YAML::Value << YAML::BeginSeq;
        for (const auto &column : strategy.columns)
            emit_column(out, column);
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return out.c_str();
}

void StrategyFile::write(const std::string &path, const std::vector<StrategyInFile> &strategies)
{
    std::ofstream out(path);
    if (!out.is_open())
        throw StrategyFileError("Could not open " + path + " for writing");

    out << emit(strategies) << "\n";
    if (!out)
        throw StrategyFileError("Could not write strategy file " + path);
}

std::set<SimpleColumn> StrategyFile::read_columns(const std::string &path)
{
    std::set<SimpleColumn> columns;
    try
    {
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsMap())
            throw StrategyFileError("A columns file must map table names to lists of columns");

        for (auto table_it = root.begin(); table_it != root.end(); ++table_it)
        {
            std::string table_name = table_it->first.as<std::string>();
            const YAML::Node &table_node = table_it->second;
            if (!table_node.IsSequence())
                throw StrategyFileError("The columns of table " + table_name + " must be a list");

            for (const auto &column : table_node)
                columns.insert(SimpleColumn{table_name, column.as<std::string>()});
        }
    }
    catch (const YAML::Exception &e)
    {
        throw StrategyFileError("Could not read columns file " + path + ": " + e.what());
    }
    return columns;
}

std::vector<StrategyInFile> generate_strategies(const std::set<SimpleColumn> &columns)
{
    std::vector<StrategyInFile> strategies;
    for (const auto &column : columns)
    {
        if (strategies.empty() || strategies.back().table_name != column.table_name)
            strategies.push_back(StrategyInFile{column.table_name, "", false, {}});
        strategies.back().columns.push_back(column_for_review(column.column_name));
    }
    return strategies;
}

std::vector<StrategyInFile> fix_strategies(std::vector<StrategyInFile> strategies, const DbErrors &errors)
{
    const std::set<SimpleColumn> stale_columns(errors.missing_from_db.begin(), errors.missing_from_db.end());
    const std::set<std::string> stale_tables(errors.truncated_tables_missing_from_db.begin(),
                                             errors.truncated_tables_missing_from_db.end());

    std::vector<StrategyInFile> fixed;
    for (auto &strategy : strategies)
    {
        if (strategy.truncate && stale_tables.count(strategy.table_name))
            continue;

        size_t before = strategy.columns.size();
        strategy.columns.erase(std::remove_if(strategy.columns.begin(), strategy.columns.end(),
                                              [&](const ColumnInFile &column) {
                                                  return stale_columns.count(
                                                      SimpleColumn{strategy.table_name, column.name});
                                              }),
                               strategy.columns.end());

        // The whole table has gone from the database.
        if (!strategy.truncate && before > 0 && strategy.columns.empty())
            continue;

        fixed.push_back(std::move(strategy));
    }

    for (const auto &missing : errors.missing_from_strategy_file)
    {
        auto table = std::find_if(fixed.begin(), fixed.end(), [&](const StrategyInFile &strategy) {
            return strategy.table_name == missing.table_name;
        });
        if (table == fixed.end())
        {
            fixed.push_back(StrategyInFile{missing.table_name, "", false, {}});
            table = std::prev(fixed.end());
        }
        table->columns.push_back(column_for_review(missing.column_name));
    }
    return fixed;
}

DbErrors diff_strategies_with_db(const std::vector<StrategyInFile> &strategies,
                                 const std::set<SimpleColumn> &columns_from_db)
{
    std::set<std::string> seen_tables;
    std::set<std::string> truncated_tables;
    std::set<SimpleColumn> columns_from_strategy_file;

    for (const auto &strategy : strategies)
    {
        // The first definition of a table is the one that counts.
        if (!seen_tables.insert(strategy.table_name).second)
            continue;

        if (strategy.truncate)
        {
            truncated_tables.insert(strategy.table_name);
            continue;
        }
        for (const auto &column : strategy.columns)
            columns_from_strategy_file.insert(SimpleColumn{strategy.table_name, column.name});
    }

    return compare_with_db(columns_from_strategy_file, truncated_tables, columns_from_db);
}
