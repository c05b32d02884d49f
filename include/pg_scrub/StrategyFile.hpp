#pragma once

#include "StrategyErrors.hpp"
#include "StrategyStructs.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

class StrategyFileError : public std::runtime_error
{
  public:
    explicit StrategyFileError(const std::string &message) : std::runtime_error(message)
    {
    }
};

/**
 * @brief Reads and writes strategy documents and columns files (YAML).
 *
 * Unrecognised data categories load as Unknown and unrecognised transformer names as Error, so
 * that compiling the document reports them together with every other problem. Anything that is
 * not structurally a strategy document throws StrategyFileError.
 */
class StrategyFile
{
  public:
    static std::vector<StrategyInFile> read(const std::string &path);
    static std::vector<StrategyInFile> parse(const YAML::Node &root);

    static void write(const std::string &path, const std::vector<StrategyInFile> &strategies);
    static std::string emit(const std::vector<StrategyInFile> &strategies);

    // A columns file maps each table name to the list of its column names.
    static std::set<SimpleColumn> read_columns(const std::string &path);
};

/**
 * @brief A strategy document covering every given column with an Unknown category and the Error
 * transformer, so it cannot be used until someone has reviewed each column.
 */
std::vector<StrategyInFile> generate_strategies(const std::set<SimpleColumn> &columns);

/**
 * @brief Brings a strategy document in line with the live schema.
 *
 * Columns missing from the document are added for review (Unknown/Error), columns and truncated
 * tables missing from the database are removed.
 */
std::vector<StrategyInFile> fix_strategies(std::vector<StrategyInFile> strategies, const DbErrors &errors);

// The schema diff for a document that has not been compiled (and may not compile yet).
DbErrors diff_strategies_with_db(const std::vector<StrategyInFile> &strategies,
                                 const std::set<SimpleColumn> &columns_from_db);
