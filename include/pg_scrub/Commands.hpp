#pragma once

#include "StrategyStructs.hpp"
#include <optional>
#include <string>

struct CommandOptions
{
    std::string input_file;
    std::string output_file;
    std::string strategy_file;
    std::string columns_file;
    TransformerOverrides overrides;
    std::optional<unsigned int> seed;
};

// Each command reports to stdout/stderr and returns the process exit code.
int run_anonymise(const CommandOptions &options);
int run_check_strategies(const CommandOptions &options);
int run_generate_strategies(const CommandOptions &options);
int run_fix_strategies(const CommandOptions &options);
