#pragma once

#include "Fakes.hpp"
#include "RowCodec.hpp"
#include "StrategyStructs.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Applies a column's transformer to a single value.
 *
 * NULL stays NULL whatever the transformer. Columns whose declared type is an array have their
 * elements transformed one by one. The Error transformer is rejected when the strategy file is
 * compiled, so reaching it here is a bug and throws std::logic_error.
 */
class ValueTransformer
{
  public:
    // Seeded from std::random_device unless a seed is given.
    explicit ValueTransformer(std::optional<unsigned int> seed = std::nullopt);

    ValueTransformer(const ValueTransformer &) = delete;
    ValueTransformer &operator=(const ValueTransformer &) = delete;

    FieldValue transform(const std::string &table_name, const std::optional<std::string> &column_type,
                         const Transformer &transformer, const FieldValue &value);

  private:
    std::mt19937 rng_;
    Fakes fakes_;

    std::string transform_scalar(const std::string &table_name, const std::optional<std::string> &column_type,
                                 const Transformer &transformer, const std::string &value);
    std::string transform_array(const std::string &table_name, const std::optional<std::string> &column_type,
                                const Transformer &transformer, const std::string &value);

    std::string scramble(const std::string &value);
    static std::string scramble_blank(const std::optional<std::string> &column_type);
    static std::string obfuscate_day(const std::string &table_name, const std::string &value);
    static std::string fixed(const std::string &table_name, const Transformer &transformer);

    static bool transforms_array_elements(TransformerType type);
    static bool is_array_type(const std::optional<std::string> &column_type);
    static std::vector<FieldValue> split_array(const std::string &table_name, const std::string &value);
    static std::string join_array(const std::vector<FieldValue> &elements);
};
