#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief A dump line that cannot be processed safely. Always fatal for the run.
 */
class DumpParseError : public std::runtime_error
{
  public:
    explicit DumpParseError(const std::string &message) : std::runtime_error(message)
    {
    }
};
