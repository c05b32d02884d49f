#pragma once

#include "Strategies.hpp"
#include "ValueTransformer.hpp"
#include <iostream>
#include <optional>
#include <set>
#include <string>

class DataProcessor
{
  public:
    explicit DataProcessor(Strategies strategies, std::optional<unsigned int> seed = std::nullopt);

    /**
     * @brief Writes an anonymised copy of the dump at @p input_file_path to @p output_file_path.
     *
     * Returns 0 on success. On any failure the partly written output file is removed and 1 is
     * returned, so a failed run never leaves a file that looks usable.
     */
    int process_dump(const std::string &input_file_path, const std::string &output_file_path);

    /**
     * @brief Rewrites a dump from @p in to @p out. Throws on the first line that cannot be handled.
     */
    void process_stream(std::istream &in, std::ostream &out);

    /**
     * @brief Every (table, column) declared by the CREATE TABLE blocks of a dump.
     */
    static std::set<SimpleColumn> read_schema(const std::string &dump_file_path);
    static std::set<SimpleColumn> read_schema(std::istream &in);

  private:
    Strategies strategies_;
    ValueTransformer transformer_;
};
