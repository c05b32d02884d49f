#include "pg_scrub/StrategyStructs.hpp"

#include <utility>

namespace
{
const std::vector<std::pair<DataCategory, std::string>> DATA_CATEGORY_NAMES = {
    {DataCategory::General, "General"},
    {DataCategory::PotentialPii, "PotentialPii"},
    {DataCategory::Pii, "Pii"},
    {DataCategory::CommerciallySensitive, "CommerciallySensitive"},
    {DataCategory::Unknown, "Unknown"},
};

const std::vector<std::pair<TransformerType, std::string>> TRANSFORMER_TYPE_NAMES = {
    {TransformerType::Error, "Error"},
    {TransformerType::EmptyJson, "EmptyJson"},
    {TransformerType::FakeBase16String, "FakeBase16String"},
    {TransformerType::FakeBase32String, "FakeBase32String"},
    {TransformerType::FakeCity, "FakeCity"},
    {TransformerType::FakeCompanyName, "FakeCompanyName"},
    {TransformerType::FakeEmail, "FakeEmail"},
    {TransformerType::FakeFirstName, "FakeFirstName"},
    {TransformerType::FakeFullAddress, "FakeFullAddress"},
    {TransformerType::FakeFullName, "FakeFullName"},
    {TransformerType::FakeIPv4, "FakeIPv4"},
    {TransformerType::FakeLastName, "FakeLastName"},
    {TransformerType::FakeNationalIdentityNumber, "FakeNationalIdentityNumber"},
    {TransformerType::FakePhoneNumber, "FakePhoneNumber"},
    {TransformerType::FakePostCode, "FakePostCode"},
    {TransformerType::FakeStreetAddress, "FakeStreetAddress"},
    {TransformerType::FakeUsername, "FakeUsername"},
    {TransformerType::FakeUUID, "FakeUUID"},
    {TransformerType::Fixed, "Fixed"},
    {TransformerType::Identity, "Identity"},
    {TransformerType::ObfuscateDay, "ObfuscateDay"},
    {TransformerType::Scramble, "Scramble"},
    {TransformerType::ScrambleBlank, "ScrambleBlank"},
};
} // namespace

std::string to_string(DataCategory category)
{
    for (const auto &entry : DATA_CATEGORY_NAMES)
    {
        if (entry.first == category)
            return entry.second;
    }
    return "Unknown";
}

std::string to_string(TransformerType type)
{
    for (const auto &entry : TRANSFORMER_TYPE_NAMES)
    {
        if (entry.first == type)
            return entry.second;
    }
    return "Error";
}

DataCategory parse_data_category(const std::string &name)
{
    for (const auto &entry : DATA_CATEGORY_NAMES)
    {
        if (entry.second == name)
            return entry.first;
    }
    return DataCategory::Unknown;
}

TransformerType parse_transformer_type(const std::string &name)
{
    for (const auto &entry : TRANSFORMER_TYPE_NAMES)
    {
        if (entry.second == name)
            return entry.first;
    }
    return TransformerType::Error;
}
