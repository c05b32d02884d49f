#include "pg_scrub/Commands.hpp"
#include "pg_scrub/DataProcessor.hpp"
#include "pg_scrub/StrategyFile.hpp"

#include <fstream>
#include <iostream>
#include <set>

namespace
{
// The live schema comes from a columns file when one is given, otherwise from the dump itself.
std::set<SimpleColumn> load_live_columns(const CommandOptions &options)
{
    if (!options.columns_file.empty())
        return StrategyFile::read_columns(options.columns_file);
    return DataProcessor::read_schema(options.input_file);
}

bool compile_strategies(const CommandOptions &options, const TransformerOverrides &overrides, Strategies &strategies)
{
    std::vector<StrategyInFile> strategies_in_file = StrategyFile::read(options.strategy_file);
    std::cout << "Loaded " << strategies_in_file.size() << " table strategies from " << options.strategy_file
              << "\n";

    ValidationErrors errors = Strategies::from_strategies_in_file(strategies_in_file, overrides, strategies);
    if (!errors.is_empty())
    {
        std::cerr << "Error: the strategy file " << options.strategy_file << " is invalid.\n" << errors;
        return false;
    }
    return true;
}

bool validate_strategies(const Strategies &strategies, const std::set<SimpleColumn> &live_columns)
{
    DbErrors errors = strategies.validate_against_db(live_columns);
    if (!errors.is_empty())
    {
        std::cerr << "Error: the strategy file does not match the database schema.\n" << errors;
        return false;
    }
    return true;
}

bool file_exists(const std::string &path)
{
    std::ifstream file(path);
    return file.good();
}
} // namespace

int run_anonymise(const CommandOptions &options)
{
    try
    {
        Strategies strategies;
        if (!compile_strategies(options, options.overrides, strategies))
            return 1;

        if (!validate_strategies(strategies, load_live_columns(options)))
            return 1;

        DataProcessor processor(std::move(strategies), options.seed);
        return processor.process_dump(options.input_file, options.output_file);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int run_check_strategies(const CommandOptions &options)
{
    try
    {
        Strategies strategies;
        if (!compile_strategies(options, TransformerOverrides::none(), strategies))
            return 1;

        if (!validate_strategies(strategies, load_live_columns(options)))
            return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All good: the strategy file is valid and matches the schema.\n";
    return 0;
}

int run_generate_strategies(const CommandOptions &options)
{
    if (file_exists(options.strategy_file))
    {
        std::cerr << "Error: " << options.strategy_file << " already exists, refusing to overwrite it.\n";
        return 1;
    }

    try
    {
        std::vector<StrategyInFile> strategies = generate_strategies(load_live_columns(options));
        StrategyFile::write(options.strategy_file, strategies);
        std::cout << "Wrote " << strategies.size() << " table strategies to " << options.strategy_file
                  << ". Every column needs a data category and transformer before it can be used.\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int run_fix_strategies(const CommandOptions &options)
{
    try
    {
        std::vector<StrategyInFile> strategies = StrategyFile::read(options.strategy_file);
        DbErrors errors = diff_strategies_with_db(strategies, load_live_columns(options));
        if (errors.is_empty())
        {
            std::cout << "Nothing to fix: the strategy file matches the schema.\n";
            return 0;
        }

        std::cout << errors;
        StrategyFile::write(options.strategy_file, fix_strategies(std::move(strategies), errors));
        std::cout << "Updated " << options.strategy_file
                  << ". New columns are marked Unknown and need reviewing.\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
