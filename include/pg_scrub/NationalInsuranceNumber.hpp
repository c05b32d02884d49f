#pragma once

#include <random>
#include <string>

/**
 * @brief UK National Insurance numbers, e.g. "AB123456C" or "AB 12 34 56 C".
 *
 * Generated numbers always pass the format checks a target system might apply: allowed prefix
 * letters, none of the unallocated prefixes, six digits and a suffix from A to D.
 */
class NationalInsuranceNumber
{
  public:
    static bool matches(const std::string &value);
    static std::string generate(std::mt19937 &rng);

    /**
     * @brief Replaces a National Insurance number with an unrelated valid one, keeping the spacing.
     */
    static std::string sanitise(const std::string &value, std::mt19937 &rng);
};
