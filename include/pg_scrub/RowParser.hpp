#pragma once

#include "State.hpp"
#include "Strategies.hpp"
#include "ValueTransformer.hpp"
#include <optional>
#include <string>

/**
 * @brief Feeds a dump through the position state machine one line at a time.
 *
 * Lines outside COPY blocks are passed through untouched. Rows inside COPY blocks are rewritten
 * with the table's transformers, or dropped when the table is truncated.
 */
class RowParser
{
  public:
    RowParser(const Strategies &strategies, ValueTransformer &transformer);

    /**
     * @brief Returns the line to write out, or std::nullopt when the line is dropped.
     *
     * Throws DumpParseError for anything that cannot be anonymised safely.
     */
    std::optional<std::string> parse(const std::string &line);

    const State &state() const
    {
        return state_;
    }
    size_t rows_transformed() const
    {
        return rows_transformed_;
    }
    size_t rows_dropped() const
    {
        return rows_dropped_;
    }

  private:
    const Strategies &strategies_;
    ValueTransformer &transformer_;
    State state_;
    size_t rows_transformed_ = 0;
    size_t rows_dropped_ = 0;
};
