#include "pg_scrub/DataProcessor.hpp"
#include "pg_scrub/CopyRow.hpp"
#include "pg_scrub/CreateRow.hpp"
#include "pg_scrub/DumpParseError.hpp"
#include "pg_scrub/RowParser.hpp"

#include <cstdio>
#include <fstream>
#include <optional>
#include <stdexcept>

DataProcessor::DataProcessor(Strategies strategies, std::optional<unsigned int> seed)
    : strategies_(std::move(strategies)), transformer_(seed)
{
}

void DataProcessor::process_stream(std::istream &in, std::ostream &out)
{
    RowParser parser(strategies_, transformer_);
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line))
    {
        line_number++;
        std::optional<std::string> processed;
        try
        {
            processed = parser.parse(line);
        }
        catch (const DumpParseError &e)
        {
            throw DumpParseError("Line " + std::to_string(line_number) + ": " + e.what());
        }
        catch (const std::invalid_argument &e)
        {
            throw DumpParseError("Line " + std::to_string(line_number) + ": " + e.what());
        }

        if (processed)
            out << *processed << "\n";
    }

    if (!std::holds_alternative<Normal>(parser.state().position))
        throw DumpParseError("Dump ended in the middle of a CREATE TABLE or COPY block");

    std::cout << "Rows anonymised: " << parser.rows_transformed() << "\n";
    std::cout << "Rows dropped from truncated tables: " << parser.rows_dropped() << "\n";
}

int DataProcessor::process_dump(const std::string &input_file_path, const std::string &output_file_path)
{
    std::ifstream file(input_file_path);
    if (!file.is_open())
    {
        std::cerr << "Error: could not open input file " << input_file_path << "\n";
        return 1;
    }

    std::ofstream out(output_file_path);
    if (!out.is_open())
    {
        std::cerr << "Error: could not open output file " << output_file_path << "\n";
        return 1;
    }

    try
    {
        process_stream(file, out);
        out.flush();
        if (!out)
            throw std::runtime_error("failed writing to " + output_file_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        out.close();
        if (std::remove(output_file_path.c_str()) != 0)
            std::cerr << "Warning: could not remove partial output file " << output_file_path << "\n";
        return 1;
    }
    return 0;
}

std::set<SimpleColumn> DataProcessor::read_schema(const std::string &dump_file_path)
{
    std::ifstream file(dump_file_path);
    if (!file.is_open())
        throw std::runtime_error("could not open dump file " + dump_file_path);
    return read_schema(file);
}

std::set<SimpleColumn> DataProcessor::read_schema(std::istream &in)
{
    std::set<SimpleColumn> columns;
    std::optional<std::string> current_table;
    bool in_copy = false;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line))
    {
        line_number++;

        // Row data can look like anything, including a CREATE TABLE line.
        if (in_copy)
        {
            in_copy = !CopyRow::is_end(line);
            continue;
        }

        if (!current_table)
        {
            current_table = CreateRow::parse_header(line);
            if (!current_table)
                in_copy = CopyRow::parse_header(line).has_value();
            continue;
        }

        if (CreateRow::is_end(line))
        {
            current_table.reset();
            continue;
        }

        try
        {
            if (auto column = CreateRow::parse_column(line))
                columns.insert(SimpleColumn{*current_table, column->name});
        }
        catch (const DumpParseError &e)
        {
            throw DumpParseError("Line " + std::to_string(line_number) + ": " + e.what());
        }
    }
    return columns;
}
