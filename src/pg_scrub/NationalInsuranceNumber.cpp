#include "pg_scrub/NationalInsuranceNumber.hpp"

#include <cctype>
#include <regex>
#include <set>

namespace
{
const std::string FIRST_PREFIX_LETTERS = "ABCEGHJKLMNOPRSTWXYZ";
const std::string SECOND_PREFIX_LETTERS = "ABCEGHJKLMNPRSTWXYZ";
const std::string SUFFIX_LETTERS = "ABCD";
const std::set<std::string> UNALLOCATED_PREFIXES = {"BG", "GB", "KN", "NK", "NT", "TN", "ZZ"};

char pick(const std::string &options, std::mt19937 &rng)
{
    std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
    return options[dist(rng)];
}
} // namespace

bool NationalInsuranceNumber::matches(const std::string &value)
{
    static const std::regex ni_pattern(
        R"(^\s*([A-CEGHJ-PR-TW-Z][A-CEGHJ-NPR-TW-Z])\s?\d{2}\s?\d{2}\s?\d{2}\s?[A-D]\s*$)", std::regex::icase);
    std::smatch matches;
    if (!std::regex_match(value, matches, ni_pattern))
        return false;

    std::string prefix = matches[1].str();
    for (auto &c : prefix)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return !UNALLOCATED_PREFIXES.count(prefix);
}

std::string NationalInsuranceNumber::generate(std::mt19937 &rng)
{
    std::string prefix;
    do
    {
        prefix = {pick(FIRST_PREFIX_LETTERS, rng), pick(SECOND_PREFIX_LETTERS, rng)};
    } while (UNALLOCATED_PREFIXES.count(prefix));

    std::uniform_int_distribution<int> digit(0, 9);
    std::string number = prefix;
    for (int i = 0; i < 6; ++i)
        number += static_cast<char>('0' + digit(rng));
    number += pick(SUFFIX_LETTERS, rng);
    return number;
}

std::string NationalInsuranceNumber::sanitise(const std::string &value, std::mt19937 &rng)
{
    std::string replacement = generate(rng);
    std::string result;
    size_t next = 0;

    for (char c : value)
    {
        if (std::isspace(static_cast<unsigned char>(c)) || next >= replacement.size())
            result += c;
        else
            result += replacement[next++];
    }
    return result;
}
