#include "pg_scrub/ValueTransformer.hpp"
#include "pg_scrub/DumpParseError.hpp"
#include "pg_scrub/NationalInsuranceNumber.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <stdexcept>

namespace
{
const std::set<std::string> NUMERIC_TYPES = {"smallint", "integer",   "bigint",     "int",    "int2",
                                             "int4",     "int8",      "numeric",    "decimal", "real",
                                             "float4",   "float8",    "double precision", "smallserial",
                                             "serial",   "bigserial", "money"};

const std::string LOWER_LETTERS = "abcdefghijklmnopqrstuvwxyz";
const std::string UPPER_LETTERS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

std::string element_type(const std::optional<std::string> &column_type)
{
    std::string type = *column_type;
    while (type.size() >= 2 && type.compare(type.size() - 2, 2, "[]") == 0)
        type.erase(type.size() - 2);
    return type;
}

bool needs_quotes(const std::string &element)
{
    if (element.empty())
        return true;

    std::string upper = element;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if (upper == "NULL")
        return true;

    return std::any_of(element.begin(), element.end(), [](unsigned char c) {
        return c == '{' || c == '}' || c == ',' || c == '"' || c == '\\' || std::isspace(c);
    });
}
} // namespace

ValueTransformer::ValueTransformer(std::optional<unsigned int> seed)
    : rng_(seed ? *seed : std::random_device{}()), fakes_(rng_)
{
}

FieldValue ValueTransformer::transform(const std::string &table_name, const std::optional<std::string> &column_type,
                                       const Transformer &transformer, const FieldValue &value)
{
    if (!value || transformer.name == TransformerType::Identity)
        return value;

    if (is_array_type(column_type) && transforms_array_elements(transformer.name))
        return transform_array(table_name, column_type, transformer, *value);

    return transform_scalar(table_name, column_type, transformer, *value);
}

std::string ValueTransformer::transform_scalar(const std::string &table_name,
                                               const std::optional<std::string> &column_type,
                                               const Transformer &transformer, const std::string &value)
{
    switch (transformer.name)
    {
    case TransformerType::Error:
        throw std::logic_error("Error transformer reached while processing table " + table_name);
    case TransformerType::Identity:
        return value;
    case TransformerType::EmptyJson:
        return "{}";
    case TransformerType::FakeBase16String:
        return fakes_.base16_string(value.size());
    case TransformerType::FakeBase32String:
        return fakes_.base32_string(value.size());
    case TransformerType::FakeCity:
        return fakes_.city();
    case TransformerType::FakeCompanyName:
        return fakes_.company_name();
    case TransformerType::FakeEmail:
        return fakes_.email();
    case TransformerType::FakeFirstName:
        return fakes_.first_name();
    case TransformerType::FakeFullAddress:
        return fakes_.full_address();
    case TransformerType::FakeFullName:
        return fakes_.full_name();
    case TransformerType::FakeIPv4:
        return fakes_.ipv4();
    case TransformerType::FakeLastName:
        return fakes_.last_name();
    case TransformerType::FakeNationalIdentityNumber:
        return NationalInsuranceNumber::generate(rng_);
    case TransformerType::FakePhoneNumber:
        return fakes_.phone_number();
    case TransformerType::FakePostCode:
        return fakes_.post_code();
    case TransformerType::FakeStreetAddress:
        return fakes_.street_address();
    case TransformerType::FakeUsername:
        return fakes_.username();
    case TransformerType::FakeUUID:
        return fakes_.uuid();
    case TransformerType::Fixed:
        return fixed(table_name, transformer);
    case TransformerType::ObfuscateDay:
        return obfuscate_day(table_name, value);
    case TransformerType::Scramble:
        return scramble(value);
    case TransformerType::ScrambleBlank:
        return scramble_blank(column_type);
    }
    throw std::logic_error("Unhandled transformer " + to_string(transformer.name));
}

std::string ValueTransformer::transform_array(const std::string &table_name,
                                              const std::optional<std::string> &column_type,
                                              const Transformer &transformer, const std::string &value)
{
    std::optional<std::string> type = element_type(column_type);
    std::vector<FieldValue> elements = split_array(table_name, value);

    for (auto &element : elements)
    {
        if (element)
            element = transform_scalar(table_name, type, transformer, *element);
    }
    return join_array(elements);
}

std::string ValueTransformer::scramble(const std::string &value)
{
    if (NationalInsuranceNumber::matches(value))
        return NationalInsuranceNumber::sanitise(value, rng_);

    std::uniform_int_distribution<size_t> letter(0, LOWER_LETTERS.size() - 1);
    std::uniform_int_distribution<int> digit(0, 9);
    std::uniform_int_distribution<int> leading_digit(1, 9);

    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(value[i]);
        if (std::islower(c))
        {
            result += LOWER_LETTERS[letter(rng_)];
        }
        else if (std::isupper(c))
        {
            result += UPPER_LETTERS[letter(rng_)];
        }
        else if (std::isdigit(c))
        {
            bool leading = i == 0 && value.size() > 1;
            result += static_cast<char>('0' + (leading ? leading_digit(rng_) : digit(rng_)));
        }
        else if (c >= 0x80)
        {
            // One letter per multi-byte UTF-8 character; continuation bytes are dropped.
            if ((c & 0xC0) != 0x80)
                result += LOWER_LETTERS[letter(rng_)];
        }
        else
        {
            result += value[i];
        }
    }
    return result;
}

std::string ValueTransformer::scramble_blank(const std::optional<std::string> &column_type)
{
    if (is_array_type(column_type))
        return "{}";
    if (column_type && NUMERIC_TYPES.count(*column_type))
        return "0";
    return "";
}

std::string ValueTransformer::obfuscate_day(const std::string &table_name, const std::string &value)
{
    static const std::regex date_pattern(R"(^(\d{4}-\d{2}-)\d{2}(.*)$)");
    std::smatch matches;
    if (!std::regex_match(value, matches, date_pattern))
        throw DumpParseError("ObfuscateDay expects a date value in table " + table_name);
    return matches[1].str() + "01" + matches[2].str();
}

std::string ValueTransformer::fixed(const std::string &table_name, const Transformer &transformer)
{
    if (transformer.args)
    {
        auto it = transformer.args->find("value");
        if (it != transformer.args->end())
            return it->second;
    }
    throw std::invalid_argument("Fixed transformer without a 'value' argument in table " + table_name);
}

bool ValueTransformer::transforms_array_elements(TransformerType type)
{
    switch (type)
    {
    case TransformerType::Error:
    case TransformerType::Identity:
    case TransformerType::EmptyJson:
    case TransformerType::Fixed:
    case TransformerType::ObfuscateDay:
    case TransformerType::ScrambleBlank:
        return false;
    default:
        return true;
    }
}

bool ValueTransformer::is_array_type(const std::optional<std::string> &column_type)
{
    return column_type && column_type->size() > 2 &&
           column_type->compare(column_type->size() - 2, 2, "[]") == 0;
}

std::vector<FieldValue> ValueTransformer::split_array(const std::string &table_name, const std::string &value)
{
    if (value.size() < 2 || value.front() != '{' || value.back() != '}')
        throw DumpParseError("Malformed array value in table " + table_name);

    std::vector<FieldValue> elements;
    const std::string inner = value.substr(1, value.size() - 2);
    if (inner.empty())
        return elements;

    size_t i = 0;
    while (true)
    {
        std::string element;
        bool quoted = false;

        if (i < inner.size() && inner[i] == '"')
        {
            quoted = true;
            bool closed = false;
            for (++i; i < inner.size(); ++i)
            {
                if (inner[i] == '\\' && i + 1 < inner.size())
                {
                    element += inner[++i];
                }
                else if (inner[i] == '"')
                {
                    closed = true;
                    ++i;
                    break;
                }
                else
                {
                    element += inner[i];
                }
            }
            if (!closed)
                throw DumpParseError("Unterminated quoted array element in table " + table_name);
        }
        else
        {
            while (i < inner.size() && inner[i] != ',')
            {
                if (inner[i] == '{' || inner[i] == '}')
                    throw DumpParseError("Multi-dimensional arrays are not supported (table " + table_name + ")");
                element += inner[i++];
            }
        }

        std::string upper = element;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
        if (!quoted && upper == "NULL")
            elements.push_back(std::nullopt);
        else
            elements.push_back(element);

        if (i >= inner.size())
            break;
        if (inner[i] != ',')
            throw DumpParseError("Malformed array value in table " + table_name);
        ++i;
    }
    return elements;
}

std::string ValueTransformer::join_array(const std::vector<FieldValue> &elements)
{
    std::string result = "{";
    for (size_t i = 0; i < elements.size(); ++i)
    {
        if (i > 0)
            result += ",";

        const FieldValue &element = elements[i];
        if (!element)
        {
            result += "NULL";
        }
        else if (needs_quotes(*element))
        {
            result += '"';
            for (char c : *element)
            {
                if (c == '"' || c == '\\')
                    result += '\\';
                result += c;
            }
            result += '"';
        }
        else
        {
            result += *element;
        }
    }
    return result + "}";
}
