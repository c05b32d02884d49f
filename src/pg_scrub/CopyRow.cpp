#include "pg_scrub/CopyRow.hpp"
#include "pg_scrub/CreateRow.hpp"
#include "pg_scrub/DumpParseError.hpp"
#include "pg_scrub/RowCodec.hpp"
#include "pg_scrub/Strategies.hpp"
#include "pg_scrub/Types.hpp"
#include "pg_scrub/ValueTransformer.hpp"

#include <regex>

void CopyRow::parse_columns(const std::string &raw_columns, std::vector<std::string> &columns)
{
    size_t start = raw_columns.find('(');
    size_t end = raw_columns.find_last_of(')');
    if (start == std::string::npos || end == std::string::npos || end <= start)
        return;

    std::string columns_str = raw_columns.substr(start + 1, end - start - 1);
    std::string current;
    bool in_quotes = false;

    for (char c : columns_str)
    {
        if (c == '"')
            in_quotes = !in_quotes;

        if (c == ',' && !in_quotes)
        {
            columns.push_back(CreateRow::unquote_identifier(CreateRow::trim(current)));
            current.clear();
        }
        else
        {
            current += c;
        }
    }
    std::string last = CreateRow::trim(current);
    if (!last.empty())
        columns.push_back(CreateRow::unquote_identifier(last));
}

std::optional<CopyRow::Header> CopyRow::parse_header(const std::string &line)
{
    static const std::regex copy_pattern(R"(^\s*COPY\s+((?:"[^"]*"|[\w\.])+)\s*(\([^;]+\))?\s+FROM\s+stdin\s*;\s*$)",
                                         std::regex::icase);
    std::smatch matches;
    if (!std::regex_match(line, matches, copy_pattern))
        return std::nullopt;

    Header header;
    header.table_name = CreateRow::unquote_identifier(matches[1].str());
    if (matches[2].matched)
        parse_columns(matches[2].str(), header.columns);
    return header;
}

bool CopyRow::is_end(const std::string &line)
{
    static const std::regex end_pattern(R"(^\s*\\\.\s*$)", std::regex::optimize);
    return std::regex_match(line, end_pattern);
}

CurrentTableTransforms CopyRow::bind(const Header &header, const Strategies &strategies)
{
    const TableStrategy *table = strategies.for_table(header.table_name);
    if (!table)
        throw DumpParseError("No strategy defined for table " + header.table_name +
                             "; every table with data in the dump needs one");

    CurrentTableTransforms current_table{header.table_name, header.columns, std::nullopt};

    const auto *columns = std::get_if<ColumnStrategies>(table);
    if (!columns)
        return current_table;

    std::vector<Transformer> transforms;
    transforms.reserve(header.columns.size());
    for (const auto &column : header.columns)
    {
        auto it = columns->find(column);
        if (it == columns->end())
            throw DumpParseError("No strategy defined for column " + header.table_name + "." + column);
        transforms.push_back(it->second.transformer);
    }
    current_table.transforms = std::move(transforms);
    return current_table;
}

std::optional<std::string> CopyRow::transform_row(const std::string &line,
                                                  const CurrentTableTransforms &current_table, const Types &types,
                                                  ValueTransformer &transformer)
{
    if (!current_table.transforms)
        return std::nullopt;

    const auto &transforms = *current_table.transforms;
    std::vector<std::string> raw_fields = RowCodec::split_row(line);

    if (raw_fields.size() != transforms.size())
    {
        throw DumpParseError("Row in " + current_table.table_name + " has " + std::to_string(raw_fields.size()) +
                             " fields but the COPY header lists " + std::to_string(transforms.size()) + " columns");
    }

    for (size_t i = 0; i < raw_fields.size(); ++i)
    {
        // Decoded even when unchanged, so a malformed field is always rejected.
        FieldValue value = RowCodec::decode_field(raw_fields[i]);

        // Identity fields keep their original text, raw control bytes included.
        if (transforms[i].name == TransformerType::Identity)
            continue;

        std::optional<std::string> column_type = types.lookup(current_table.table_name, current_table.columns[i]);
        raw_fields[i] =
            RowCodec::encode_field(transformer.transform(current_table.table_name, column_type, transforms[i], value));
    }

    return RowCodec::join_row(raw_fields);
}
