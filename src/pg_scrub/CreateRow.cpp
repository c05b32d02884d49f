#include "pg_scrub/CreateRow.hpp"
#include "pg_scrub/DumpParseError.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <vector>

namespace
{
// Words that end the type part of a column definition.
const std::set<std::string> COLUMN_CONSTRAINT_KEYWORDS = {"NOT",        "NULL",    "DEFAULT", "COLLATE", "GENERATED",
                                                          "CONSTRAINT", "PRIMARY", "UNIQUE",  "CHECK",   "REFERENCES"};

// First words of table constraints, which sit in the column list but declare no column.
const std::set<std::string> TABLE_CONSTRAINT_KEYWORDS = {"CONSTRAINT", "PRIMARY", "UNIQUE",
                                                         "CHECK",      "FOREIGN", "EXCLUDE"};

std::string to_upper(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
    return str;
}
} // namespace

std::optional<std::string> CreateRow::parse_header(const std::string &line)
{
    static const std::regex create_pattern(R"(^\s*CREATE\s+(?:UNLOGGED\s+)?TABLE\s+((?:"[^"]*"|[^\s("])+)\s*\(\s*$)",
                                           std::regex::icase);
    std::smatch matches;
    if (!std::regex_match(line, matches, create_pattern))
        return std::nullopt;
    return unquote_identifier(matches[1].str());
}

bool CreateRow::is_end(const std::string &line)
{
    std::string trimmed = trim(line);
    return !trimmed.empty() && trimmed[0] == ')';
}

std::optional<Column> CreateRow::parse_column(const std::string &line)
{
    std::string body = trim(line);
    if (!body.empty() && body.back() == ',')
    {
        body.pop_back();
        body = trim(body);
    }
    if (body.empty())
        throw DumpParseError("Expected a column definition inside CREATE TABLE but found an empty line");

    std::string name;
    size_t pos = 0;

    if (body[0] == '"')
    {
        bool closed = false;
        for (pos = 1; pos < body.size(); ++pos)
        {
            if (body[pos] != '"')
            {
                name += body[pos];
                continue;
            }
            if (pos + 1 < body.size() && body[pos + 1] == '"')
            {
                name += '"';
                ++pos;
                continue;
            }
            closed = true;
            ++pos;
            break;
        }
        if (!closed)
            throw DumpParseError("Unterminated quoted column name: " + body);
    }
    else
    {
        pos = std::min(body.find_first_of(" \t"), body.size());
        name = body.substr(0, pos);
        if (TABLE_CONSTRAINT_KEYWORDS.count(to_upper(name)))
            return std::nullopt;
    }

    std::vector<std::string> words;
    std::string word;
    int depth = 0;
    bool reached_constraint = false;

    auto finish_word = [&]() {
        if (word.empty())
            return false;
        if (COLUMN_CONSTRAINT_KEYWORDS.count(to_upper(word)))
            return true;
        words.push_back(unquote_identifier(word));
        word.clear();
        return false;
    };

    for (size_t i = pos; i < body.size(); ++i)
    {
        char c = body[i];
        // Type modifiers such as (255) or (15,4) are not part of the base type.
        if (c == '(')
        {
            depth++;
            continue;
        }
        if (c == ')')
        {
            if (depth > 0)
                depth--;
            continue;
        }
        if (depth > 0)
            continue;

        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (finish_word())
            {
                reached_constraint = true;
                break;
            }
            continue;
        }
        word += c;
    }
    if (!reached_constraint)
        finish_word();

    if (name.empty() || words.empty())
        throw DumpParseError("Could not parse column definition: " + body);

    std::string data_type = words[0];
    for (size_t i = 1; i < words.size(); ++i)
        data_type += " " + words[i];

    return Column{name, data_type};
}

std::string CreateRow::unquote_identifier(const std::string &identifier)
{
    std::string result;
    bool in_quotes = false;

    for (size_t i = 0; i < identifier.size(); ++i)
    {
        char c = identifier[i];
        if (c != '"')
        {
            result += c;
        }
        else if (in_quotes && i + 1 < identifier.size() && identifier[i + 1] == '"')
        {
            result += '"';
            ++i;
        }
        else
        {
            in_quotes = !in_quotes;
        }
    }
    return result;
}

std::string CreateRow::trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\r");
    if (std::string::npos == first)
        return "";
    size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, (last - first + 1));
}
