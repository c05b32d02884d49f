#include "pg_scrub/RowCodec.hpp"
#include "pg_scrub/DumpParseError.hpp"

std::vector<std::string> RowCodec::split_row(const std::string &line)
{
    std::vector<std::string> raw_fields;
    size_t start = 0;

    // Escaped tabs never appear raw, so splitting before decoding is safe.
    while (true)
    {
        size_t end = line.find(DELIMITER, start);
        if (end == std::string::npos)
        {
            raw_fields.push_back(line.substr(start));
            break;
        }
        raw_fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return raw_fields;
}

std::string RowCodec::join_row(const std::vector<std::string> &raw_fields)
{
    std::string line;
    for (size_t i = 0; i < raw_fields.size(); ++i)
    {
        if (i > 0)
            line += DELIMITER;
        line += raw_fields[i];
    }
    return line;
}

std::vector<FieldValue> RowCodec::decode_row(const std::string &line)
{
    std::vector<FieldValue> fields;
    for (const auto &raw : split_row(line))
        fields.push_back(decode_field(raw));
    return fields;
}

std::string RowCodec::encode_row(const std::vector<FieldValue> &fields)
{
    std::vector<std::string> raw_fields;
    raw_fields.reserve(fields.size());
    for (const auto &field : fields)
        raw_fields.push_back(encode_field(field));
    return join_row(raw_fields);
}

FieldValue RowCodec::decode_field(const std::string &raw)
{
    if (raw == NULL_MARKER)
        return std::nullopt;

    std::string value;
    value.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i)
    {
        if (raw[i] != '\\')
        {
            value += raw[i];
            continue;
        }

        if (i + 1 >= raw.size())
            throw DumpParseError("Unterminated escape sequence at end of field: " + raw +
                                 " (pg_dump never writes a lone backslash; the input is not pg_dump output)");

        char escaped = raw[++i];
        switch (escaped)
        {
        case '\\':
            value += '\\';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'v':
            value += '\v';
            break;
        default:
            throw DumpParseError(std::string("Unsupported escape sequence \\") + escaped + " in field: " + raw +
                                 " (pg_dump never writes this escape, e.g. octal or hex; the input is not pg_dump output)");
        }
    }
    return value;
}

std::string RowCodec::encode_field(const FieldValue &value)
{
    if (!value)
        return NULL_MARKER;

    std::string raw;
    raw.reserve(value->size());

    for (char c : *value)
    {
        switch (c)
        {
        case '\\':
            raw += "\\\\";
            break;
        case '\b':
            raw += "\\b";
            break;
        case '\f':
            raw += "\\f";
            break;
        case '\n':
            raw += "\\n";
            break;
        case '\r':
            raw += "\\r";
            break;
        case '\t':
            raw += "\\t";
            break;
        case '\v':
            raw += "\\v";
            break;
        default:
            raw += c;
        }
    }
    return raw;
}
