#include "pg_scrub/Commands.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>

const std::string STRATEGIES_FLAG = "--strategies";
const std::string STRATEGIES_SHORT_FLAG = "-s";
const std::string INPUT_FLAG = "--input";
const std::string INPUT_SHORT_FLAG = "-i";
const std::string OUTPUT_FLAG = "--output";
const std::string OUTPUT_SHORT_FLAG = "-o";
const std::string COLUMNS_FLAG = "--columns";
const std::string COLUMNS_SHORT_FLAG = "-l";
const std::string SEED_FLAG = "--seed";
const std::string ALLOW_POTENTIAL_PII_FLAG = "--allow-potential-pii";
const std::string ALLOW_COMMERCIALLY_SENSITIVE_FLAG = "--allow-commercially-sensitive";
const std::string SCRAMBLE_BLANK_FLAG = "--scramble-blank";
const std::string HELP_FLAG = "--help";
const std::string HELP_SHORT_FLAG = "-h";

const std::string ANONYMISE_COMMAND = "anonymise";
const std::string CHECK_STRATEGIES_COMMAND = "check-strategies";
const std::string GENERATE_STRATEGIES_COMMAND = "generate-strategies";
const std::string FIX_STRATEGIES_COMMAND = "fix-strategies";

// Printed to stderr.
void show_usage(const std::string &program_name)
{
    std::cerr << "--- pg_scrub ---\n";
    std::cerr << "Anonymises PostgreSQL plain SQL dump files using a validated strategy file.\n";
    std::cerr << "Usage: " << program_name << " <command> [OPTIONS]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  " << ANONYMISE_COMMAND << "\t\tWrite an anonymised copy of the dump (needs -s, -i, -o).\n";
    std::cerr << "  " << CHECK_STRATEGIES_COMMAND << "\tValidate the strategy file against the schema (needs -s and -i or -l).\n";
    std::cerr << "  " << GENERATE_STRATEGIES_COMMAND << "\tWrite a strategy file skeleton for a schema (needs -s and -i or -l).\n";
    std::cerr << "  " << FIX_STRATEGIES_COMMAND << "\tAdd missing and remove stale columns in the strategy file (needs -s and -i or -l).\n\n";
    std::cerr << "Flags:\n";
    std::cerr << "  " << STRATEGIES_SHORT_FLAG << ", " << STRATEGIES_FLAG << "\t<file>  The YAML strategy file.\n";
    std::cerr << "  " << INPUT_SHORT_FLAG << ", " << INPUT_FLAG << "\t<file>  The input PostgreSQL dump file (dump.sql).\n";
    std::cerr << "  " << OUTPUT_SHORT_FLAG << ", " << OUTPUT_FLAG << "\t<file>  The output file for the anonymised dump.\n";
    std::cerr << "  " << COLUMNS_SHORT_FLAG << ", " << COLUMNS_FLAG
              << "\t<file>  YAML map of table name to columns, used instead of the dump's schema.\n";
    std::cerr << "      " << SEED_FLAG << "\t<n>     Seed for the random generator (repeatable output).\n";
    std::cerr << "      " << ALLOW_POTENTIAL_PII_FLAG << "\t\tLeave PotentialPii columns unchanged.\n";
    std::cerr << "      " << ALLOW_COMMERCIALLY_SENSITIVE_FLAG << "\tLeave CommerciallySensitive columns unchanged.\n";
    std::cerr << "      " << SCRAMBLE_BLANK_FLAG << "\t\tReplace Scramble with a blank placeholder.\n";
    std::cerr << "  " << HELP_SHORT_FLAG << ", " << HELP_FLAG << "\t\tPrint this text and exit.\n";
    std::cerr << "\nExample: " << program_name << " anonymise -s strategy.yaml -i dump.sql -o out.sql\n";
}

// Flags that take a value, keyed by every spelling accepted on the command line.
const std::map<std::string, std::string> VALUE_FLAGS = {
    {STRATEGIES_FLAG, STRATEGIES_FLAG}, {STRATEGIES_SHORT_FLAG, STRATEGIES_FLAG},
    {INPUT_FLAG, INPUT_FLAG},           {INPUT_SHORT_FLAG, INPUT_FLAG},
    {OUTPUT_FLAG, OUTPUT_FLAG},         {OUTPUT_SHORT_FLAG, OUTPUT_FLAG},
    {COLUMNS_FLAG, COLUMNS_FLAG},       {COLUMNS_SHORT_FLAG, COLUMNS_FLAG},
    {SEED_FLAG, SEED_FLAG},
};

const std::set<std::string> SWITCH_FLAGS = {ALLOW_POTENTIAL_PII_FLAG, ALLOW_COMMERCIALLY_SENSITIVE_FLAG,
                                            SCRAMBLE_BLANK_FLAG};

/**
 * @brief Collects the flags that follow the command, from argv[first] on.
 *
 * Values are stored under the long spelling of their flag, switches as "true". Returns nullopt
 * after printing the problem when a flag is unknown or lacks its value.
 */
std::optional<std::map<std::string, std::string>> read_flags(int argc, char *argv[], int first)
{
    std::map<std::string, std::string> flags;

    for (int i = first; i < argc; ++i)
    {
        const std::string flag = argv[i];

        if (flag == HELP_FLAG || flag == HELP_SHORT_FLAG || SWITCH_FLAGS.count(flag))
        {
            flags[flag == HELP_SHORT_FLAG ? HELP_FLAG : flag] = "true";
            continue;
        }

        auto canonical = VALUE_FLAGS.find(flag);
        if (canonical == VALUE_FLAGS.end())
        {
            std::cerr << "Error: unrecognised argument " << flag << "\n";
            return std::nullopt;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "Error: " << flag << " must be followed by a value.\n";
            return std::nullopt;
        }
        flags[canonical->second] = argv[++i];
    }
    return flags;
}

std::string flag_value(const std::map<std::string, std::string> &flags, const std::string &flag)
{
    auto it = flags.find(flag);
    return it == flags.end() ? "" : it->second;
}

// Fills @p options from the parsed flags. Returns false after printing the problem.
bool build_options(const std::map<std::string, std::string> &flags, CommandOptions &options)
{
    options.strategy_file = flag_value(flags, STRATEGIES_FLAG);
    options.input_file = flag_value(flags, INPUT_FLAG);
    options.output_file = flag_value(flags, OUTPUT_FLAG);
    options.columns_file = flag_value(flags, COLUMNS_FLAG);
    options.overrides.allow_potential_pii = flags.count(ALLOW_POTENTIAL_PII_FLAG) > 0;
    options.overrides.allow_commercially_sensitive = flags.count(ALLOW_COMMERCIALLY_SENSITIVE_FLAG) > 0;
    options.overrides.scramble_blank = flags.count(SCRAMBLE_BLANK_FLAG) > 0;

    const std::string seed = flag_value(flags, SEED_FLAG);
    if (!seed.empty())
    {
        if (seed.find_first_not_of("0123456789") != std::string::npos || seed.size() > 9)
        {
            std::cerr << "Error: " << SEED_FLAG << " takes a whole number below 1000000000, got " << seed << ".\n";
            return false;
        }
        options.seed = static_cast<unsigned int>(std::stoul(seed));
    }

    if (options.strategy_file.empty())
    {
        std::cerr << "Error: every command needs a strategy file (" << STRATEGIES_SHORT_FLAG << ").\n";
        return false;
    }
    return true;
}

int main(int argc, char *argv[])
{
    const std::string program_name = argv[0];
    if (argc < 2)
    {
        show_usage(program_name);
        return 1;
    }

    const std::string command = argv[1];
    if (command == HELP_FLAG || command == HELP_SHORT_FLAG)
    {
        show_usage(program_name);
        return 0;
    }

    std::optional<std::map<std::string, std::string>> flags = read_flags(argc, argv, 2);
    if (!flags)
    {
        show_usage(program_name);
        return 1;
    }
    if (flags->count(HELP_FLAG))
    {
        show_usage(program_name);
        return 0;
    }

    CommandOptions options;
    if (!build_options(*flags, options))
    {
        show_usage(program_name);
        return 1;
    }

    if (command == ANONYMISE_COMMAND)
    {
        if (options.input_file.empty() || options.output_file.empty())
        {
            std::cerr << "Error: " << ANONYMISE_COMMAND << " needs an input dump (" << INPUT_SHORT_FLAG
                      << ") and an output file (" << OUTPUT_SHORT_FLAG << ").\n";
            show_usage(program_name);
            return 1;
        }

        std::cout << "Strategies: " << options.strategy_file << "\n";
        std::cout << "Dump:       " << options.input_file << "\n";
        std::cout << "Output:     " << options.output_file << "\n";

        int status = run_anonymise(options);
        if (status == 0)
            std::cout << "Anonymised dump written to " << options.output_file << "\n";
        else
            std::cerr << "Anonymisation failed, no output was written.\n";
        return status;
    }

    if (command != CHECK_STRATEGIES_COMMAND && command != GENERATE_STRATEGIES_COMMAND &&
        command != FIX_STRATEGIES_COMMAND)
    {
        std::cerr << "Error: unknown command " << command << "\n";
        show_usage(program_name);
        return 1;
    }

    if (options.input_file.empty() && options.columns_file.empty())
    {
        std::cerr << "Error: " << command << " needs a dump file (" << INPUT_SHORT_FLAG << ") or a columns file ("
                  << COLUMNS_SHORT_FLAG << ").\n";
        show_usage(program_name);
        return 1;
    }

    if (command == CHECK_STRATEGIES_COMMAND)
        return run_check_strategies(options);
    if (command == GENERATE_STRATEGIES_COMMAND)
        return run_generate_strategies(options);
    return run_fix_strategies(options);
}
