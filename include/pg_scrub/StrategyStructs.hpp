#pragma once

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

enum class DataCategory
{
    General,
    PotentialPii,
    Pii,
    CommerciallySensitive,
    Unknown
};

enum class TransformerType
{
    Error,
    EmptyJson,
    FakeBase16String,
    FakeBase32String,
    FakeCity,
    FakeCompanyName,
    FakeEmail,
    FakeFirstName,
    FakeFullAddress,
    FakeFullName,
    FakeIPv4,
    FakeLastName,
    FakeNationalIdentityNumber,
    FakePhoneNumber,
    FakePostCode,
    FakeStreetAddress,
    FakeUsername,
    FakeUUID,
    Fixed,
    Identity,
    ObfuscateDay,
    Scramble,
    ScrambleBlank
};

using TransformerArgs = std::map<std::string, std::string>;

struct Transformer
{
    TransformerType name = TransformerType::Error;
    std::optional<TransformerArgs> args;

    bool operator==(const Transformer &other) const
    {
        return name == other.name && args == other.args;
    }
    bool operator!=(const Transformer &other) const
    {
        return !(*this == other);
    }
};

struct ColumnInFile
{
    std::string name;
    std::string description;
    DataCategory data_category = DataCategory::Unknown;
    Transformer transformer;
};

struct StrategyInFile
{
    std::string table_name;
    std::string description;
    bool truncate = false;
    std::vector<ColumnInFile> columns;
};

struct ColumnInfo
{
    std::string name;
    DataCategory data_category = DataCategory::Unknown;
    Transformer transformer;

    bool operator==(const ColumnInfo &other) const
    {
        return name == other.name && data_category == other.data_category && transformer == other.transformer;
    }
};

/**
 * @brief A (table, column) pair. Only used for reporting and set comparisons.
 */
struct SimpleColumn
{
    std::string table_name;
    std::string column_name;

    bool operator<(const SimpleColumn &other) const
    {
        return std::tie(table_name, column_name) < std::tie(other.table_name, other.column_name);
    }
    bool operator==(const SimpleColumn &other) const
    {
        return table_name == other.table_name && column_name == other.column_name;
    }
};

struct TransformerOverrides
{
    bool allow_potential_pii = false;
    bool allow_commercially_sensitive = false;
    bool scramble_blank = false;

    static TransformerOverrides none()
    {
        return TransformerOverrides{};
    }
};

// Names as they appear in strategy documents.
std::string to_string(DataCategory category);
std::string to_string(TransformerType type);
DataCategory parse_data_category(const std::string &name);
TransformerType parse_transformer_type(const std::string &name);
