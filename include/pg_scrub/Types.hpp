#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

struct Column
{
    std::string name;
    std::string data_type;

    bool operator==(const Column &other) const
    {
        return name == other.name && data_type == other.data_type;
    }
};

using TableTypes = std::map<std::string, std::string>;

/**
 * @brief Declared column types of every table whose CREATE TABLE block has been read so far.
 */
class Types
{
  public:
    Types() = default;
    explicit Types(std::map<std::string, TableTypes> initial) : types_(std::move(initial))
    {
    }

    void insert(const std::string &table_name, TableTypes columns)
    {
        types_[table_name] = std::move(columns);
    }

    // A miss is not an error: the caller carries on without type information.
    std::optional<std::string> lookup(const std::string &table_name, const std::string &column_name) const
    {
        auto table = types_.find(table_name);
        if (table == types_.end())
            return std::nullopt;

        auto column = table->second.find(column_name);
        if (column == table->second.end())
            return std::nullopt;
        return column->second;
    }

    bool operator==(const Types &other) const
    {
        return types_ == other.types_;
    }

  private:
    std::map<std::string, TableTypes> types_;
};
