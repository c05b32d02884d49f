#include "pg_scrub/Strategies.hpp"

#include "gtest/gtest.h"

namespace
{
const std::string TABLE_NAME = "gert_lush_table";
const std::string PII_COLUMN_NAME = "pii_column";
const std::string COMMERCIALLY_SENSITIVE_COLUMN_NAME = "commercially_sensitive_column";
const std::string SCRAMBLED_COLUMN_NAME = "scrambled_column";

ColumnInFile column_in_file(DataCategory data_category, const std::string &name, TransformerType transformer_type)
{
    return ColumnInFile{name, name, data_category, Transformer{transformer_type, std::nullopt}};
}

StrategyInFile strategy_in_file(const std::string &table_name, std::vector<ColumnInFile> columns)
{
    return StrategyInFile{table_name, "description", false, std::move(columns)};
}

ColumnInfo column_info(const std::string &name, DataCategory data_category, TransformerType transformer_type)
{
    return ColumnInfo{name, data_category, Transformer{transformer_type, std::nullopt}};
}

SimpleColumn simple_column(const std::string &table_name, const std::string &column_name)
{
    return SimpleColumn{table_name, column_name};
}

Strategies compile(const std::vector<StrategyInFile> &strategies_in_file, const TransformerOverrides &overrides)
{
    Strategies strategies;
    ValidationErrors errors = Strategies::from_strategies_in_file(strategies_in_file, overrides, strategies);
    EXPECT_TRUE(errors.is_empty()) << errors;
    return strategies;
}

ValidationErrors compile_errors(const std::vector<StrategyInFile> &strategies_in_file)
{
    Strategies strategies;
    ValidationErrors errors =
        Strategies::from_strategies_in_file(strategies_in_file, TransformerOverrides::none(), strategies);
    EXPECT_EQ(strategies, Strategies());
    return errors;
}

Transformer transformer_for_column(const std::string &column_name, const Strategies &strategies)
{
    auto transformer = strategies.transformer_for_column(TABLE_NAME, column_name);
    EXPECT_TRUE(transformer.has_value());
    return transformer.value_or(Transformer{});
}

std::vector<StrategyInFile> potential_pii_and_commercially_sensitive()
{
    return {strategy_in_file(
        TABLE_NAME,
        {column_in_file(DataCategory::PotentialPii, PII_COLUMN_NAME, TransformerType::Scramble),
         column_in_file(DataCategory::CommerciallySensitive, COMMERCIALLY_SENSITIVE_COLUMN_NAME,
                        TransformerType::Scramble)})};
}

Strategies person_and_location()
{
    Strategies strategies;
    strategies.insert("public.person",
                      {{"first_name", column_info("first_name", DataCategory::General, TransformerType::Identity)}});
    strategies.insert("public.location",
                      {{"postcode", column_info("postcode", DataCategory::General, TransformerType::Identity)}});
    return strategies;
}
} // namespace

// --- Compiling strategy files ---

TEST(StrategiesTest, ParsesFileContentsIntoStrategies)
{
    std::vector<StrategyInFile> strategies_in_file = {
        strategy_in_file(TABLE_NAME, {column_in_file(DataCategory::Pii, "column1", TransformerType::Scramble)})};

    Strategies expected;
    expected.insert(TABLE_NAME, {{"column1", column_info("column1", DataCategory::Pii, TransformerType::Scramble)}});

    EXPECT_EQ(compile(strategies_in_file, TransformerOverrides::none()), expected);
}

TEST(StrategiesTest, TruncateEntriesCompileToTruncate)
{
    StrategyInFile truncated = strategy_in_file("public.sessions", {});
    truncated.truncate = true;

    Strategies strategies = compile({truncated}, TransformerOverrides::none());
    const TableStrategy *table = strategies.for_table("public.sessions");
    ASSERT_NE(table, nullptr);
    EXPECT_TRUE(std::holds_alternative<Truncate>(*table));
    EXPECT_EQ(strategies.for_table("public.other"), nullptr);
}

TEST(StrategiesTest, ReportsDuplicateTablesAndColumns)
{
    ColumnInFile duplicated_column = column_in_file(DataCategory::Pii, "column1", TransformerType::Scramble);

    ValidationErrors errors = compile_errors({
        strategy_in_file("t", {}),
        strategy_in_file("t", {}),
        strategy_in_file("daps", {duplicated_column, duplicated_column}),
    });

    EXPECT_EQ(errors.duplicate_tables, std::vector<std::string>{"t"});
    EXPECT_EQ(errors.duplicate_columns, std::vector<SimpleColumn>{simple_column("daps", "column1")});
    EXPECT_TRUE(errors.unanonymised_pii.empty());
    EXPECT_TRUE(errors.unknown_data_categories.empty());
    EXPECT_TRUE(errors.error_transformer_types.empty());
}

TEST(StrategiesTest, ReportsUnknownDataCategories)
{
    ValidationErrors errors = compile_errors({strategy_in_file(
        "public.person", {column_in_file(DataCategory::Unknown, "first_name", TransformerType::Identity)})});

    EXPECT_EQ(errors.unknown_data_categories,
              std::vector<SimpleColumn>{simple_column("public.person", "first_name")});
}

TEST(StrategiesTest, ReportsErrorTransformers)
{
    ValidationErrors errors = compile_errors({strategy_in_file(
        "public.person", {column_in_file(DataCategory::General, "first_name", TransformerType::Error)})});

    EXPECT_EQ(errors.error_transformer_types,
              std::vector<SimpleColumn>{simple_column("public.person", "first_name")});
}

TEST(StrategiesTest, ReportsPiiWithIdentityTransformer)
{
    ValidationErrors errors = compile_errors({strategy_in_file(
        "public.person", {column_in_file(DataCategory::Pii, "first_name", TransformerType::Identity),
                          column_in_file(DataCategory::PotentialPii, "last_name", TransformerType::Identity)})});

    EXPECT_EQ(errors.unanonymised_pii, (std::vector<SimpleColumn>{simple_column("public.person", "first_name"),
                                                                  simple_column("public.person", "last_name")}));
}

TEST(StrategiesTest, BatchesEveryKindOfError)
{
    ValidationErrors errors = compile_errors({
        strategy_in_file("a", {column_in_file(DataCategory::Pii, "x", TransformerType::Identity),
                               column_in_file(DataCategory::Unknown, "y", TransformerType::Error)}),
        strategy_in_file("a", {}),
    });

    EXPECT_EQ(errors.unanonymised_pii.size(), 1u);
    EXPECT_EQ(errors.unknown_data_categories.size(), 1u);
    EXPECT_EQ(errors.error_transformer_types.size(), 1u);
    EXPECT_EQ(errors.duplicate_tables.size(), 1u);
}

TEST(StrategiesTest, DuplicateTableColumnsAreStillChecked)
{
    ValidationErrors errors = compile_errors({
        strategy_in_file("t", {column_in_file(DataCategory::General, "a", TransformerType::Identity)}),
        strategy_in_file("t", {column_in_file(DataCategory::Unknown, "b", TransformerType::Error),
                               column_in_file(DataCategory::Pii, "c", TransformerType::Identity)}),
    });

    EXPECT_EQ(errors.duplicate_tables, std::vector<std::string>{"t"});
    EXPECT_EQ(errors.unknown_data_categories, std::vector<SimpleColumn>{simple_column("t", "b")});
    EXPECT_EQ(errors.error_transformer_types, std::vector<SimpleColumn>{simple_column("t", "b")});
    EXPECT_EQ(errors.unanonymised_pii, std::vector<SimpleColumn>{simple_column("t", "c")});
}

TEST(StrategiesTest, TruncatedTableColumnsAreChecked)
{
    StrategyInFile truncated =
        strategy_in_file("public.sessions", {column_in_file(DataCategory::Unknown, "token", TransformerType::Error)});
    truncated.truncate = true;

    ValidationErrors errors = compile_errors({truncated});
    EXPECT_EQ(errors.unknown_data_categories, std::vector<SimpleColumn>{simple_column("public.sessions", "token")});
    EXPECT_EQ(errors.error_transformer_types, std::vector<SimpleColumn>{simple_column("public.sessions", "token")});
}

TEST(StrategiesTest, TruncatedTableWithReviewedColumnsCompiles)
{
    StrategyInFile truncated =
        strategy_in_file("public.sessions", {column_in_file(DataCategory::General, "token", TransformerType::Scramble)});
    truncated.truncate = true;

    Strategies strategies = compile({truncated}, TransformerOverrides::none());
    const TableStrategy *table = strategies.for_table("public.sessions");
    ASSERT_NE(table, nullptr);
    EXPECT_TRUE(std::holds_alternative<Truncate>(*table));
}

TEST(StrategiesTest, FirstDuplicateColumnWins)
{
    std::vector<StrategyInFile> strategies_in_file = {
        strategy_in_file(TABLE_NAME, {column_in_file(DataCategory::General, "c", TransformerType::Scramble),
                                      column_in_file(DataCategory::General, "c", TransformerType::Identity)})};

    Strategies strategies;
    ValidationErrors errors =
        Strategies::from_strategies_in_file(strategies_in_file, TransformerOverrides::none(), strategies);
    EXPECT_EQ(errors.duplicate_columns, std::vector<SimpleColumn>{simple_column(TABLE_NAME, "c")});
}

// --- Override flags ---

TEST(StrategiesTest, AllowPotentialPiiForcesIdentity)
{
    TransformerOverrides overrides;
    overrides.allow_potential_pii = true;
    Strategies parsed = compile(potential_pii_and_commercially_sensitive(), overrides);

    Transformer pii_transformer = transformer_for_column(PII_COLUMN_NAME, parsed);
    EXPECT_EQ(pii_transformer.name, TransformerType::Identity);
    EXPECT_EQ(pii_transformer.args, std::nullopt);
    EXPECT_EQ(transformer_for_column(COMMERCIALLY_SENSITIVE_COLUMN_NAME, parsed).name, TransformerType::Scramble);
}

TEST(StrategiesTest, AllowCommerciallySensitiveForcesIdentity)
{
    TransformerOverrides overrides;
    overrides.allow_commercially_sensitive = true;
    Strategies parsed = compile(potential_pii_and_commercially_sensitive(), overrides);

    EXPECT_EQ(transformer_for_column(COMMERCIALLY_SENSITIVE_COLUMN_NAME, parsed).name, TransformerType::Identity);
    EXPECT_EQ(transformer_for_column(PII_COLUMN_NAME, parsed).name, TransformerType::Scramble);
}

TEST(StrategiesTest, ScrambleBlankReplacesScramble)
{
    TransformerOverrides overrides;
    overrides.scramble_blank = true;
    Strategies parsed = compile({strategy_in_file(TABLE_NAME, {column_in_file(DataCategory::General,
                                                                              SCRAMBLED_COLUMN_NAME,
                                                                              TransformerType::Scramble)})},
                                overrides);

    EXPECT_EQ(transformer_for_column(SCRAMBLED_COLUMN_NAME, parsed).name, TransformerType::ScrambleBlank);
}

TEST(StrategiesTest, CategoryOverridesBeatScrambleBlank)
{
    TransformerOverrides overrides{true, true, true};
    Strategies parsed = compile(potential_pii_and_commercially_sensitive(), overrides);

    EXPECT_EQ(transformer_for_column(COMMERCIALLY_SENSITIVE_COLUMN_NAME, parsed).name, TransformerType::Identity);
    EXPECT_EQ(transformer_for_column(PII_COLUMN_NAME, parsed).name, TransformerType::Identity);
}

TEST(StrategiesTest, DemotedPotentialPiiIsNotAnError)
{
    TransformerOverrides overrides;
    overrides.allow_potential_pii = true;
    std::vector<StrategyInFile> strategies_in_file = {strategy_in_file(
        TABLE_NAME, {column_in_file(DataCategory::PotentialPii, PII_COLUMN_NAME, TransformerType::Identity)})};

    Strategies strategies;
    EXPECT_TRUE(Strategies::from_strategies_in_file(strategies_in_file, overrides, strategies).is_empty());
}

TEST(StrategiesTest, AllowPotentialPiiDoesNotDemotePii)
{
    TransformerOverrides overrides;
    overrides.allow_potential_pii = true;
    std::vector<StrategyInFile> strategies_in_file = {
        strategy_in_file(TABLE_NAME, {column_in_file(DataCategory::Pii, PII_COLUMN_NAME, TransformerType::Scramble)})};

    Strategies parsed = compile(strategies_in_file, overrides);
    EXPECT_EQ(transformer_for_column(PII_COLUMN_NAME, parsed).name, TransformerType::Scramble);
}

TEST(StrategiesTest, OverrideResolutionIsIdempotent)
{
    const std::vector<DataCategory> categories = {DataCategory::General, DataCategory::PotentialPii, DataCategory::Pii,
                                                  DataCategory::CommerciallySensitive, DataCategory::Unknown};
    const std::vector<TransformerType> transformers = {TransformerType::Identity, TransformerType::Scramble,
                                                       TransformerType::ScrambleBlank, TransformerType::FakeEmail};

    for (int flags = 0; flags < 8; ++flags)
    {
        TransformerOverrides overrides{(flags & 1) != 0, (flags & 2) != 0, (flags & 4) != 0};
        for (DataCategory category : categories)
        {
            for (TransformerType type : transformers)
            {
                Transformer once = apply_transformer_overrides(category, overrides, Transformer{type, std::nullopt});
                Transformer twice = apply_transformer_overrides(category, overrides, once);
                EXPECT_EQ(once, twice);
            }
        }
    }
}

TEST(StrategiesTest, OverridesKeepTransformerArgs)
{
    Transformer fixed{TransformerType::Fixed, TransformerArgs{{"value", "redacted"}}};
    EXPECT_EQ(apply_transformer_overrides(DataCategory::Pii, TransformerOverrides{true, true, true}, fixed), fixed);
}

// --- Validating against the database ---

TEST(StrategiesTest, ValidateAgainstDbPassesWithMatchingColumns)
{
    DbErrors errors = person_and_location().validate_against_db(
        {simple_column("public.person", "first_name"), simple_column("public.location", "postcode")});
    EXPECT_TRUE(errors.is_empty());
}

TEST(StrategiesTest, ValidateAgainstDbReportsColumnsMissingFromStrategyFile)
{
    Strategies strategies;
    strategies.insert("public.person",
                      {{"first_name", column_info("first_name", DataCategory::General, TransformerType::Identity)}});

    DbErrors errors = strategies.validate_against_db(
        {simple_column("public.person", "first_name"), simple_column("public.location", "postcode")});

    EXPECT_TRUE(errors.missing_from_db.empty());
    EXPECT_EQ(errors.missing_from_strategy_file,
              std::vector<SimpleColumn>{simple_column("public.location", "postcode")});
}

TEST(StrategiesTest, ValidateAgainstDbReportsColumnsMissingFromDb)
{
    DbErrors errors = person_and_location().validate_against_db({simple_column("public.person", "first_name")});

    EXPECT_TRUE(errors.missing_from_strategy_file.empty());
    EXPECT_EQ(errors.missing_from_db, std::vector<SimpleColumn>{simple_column("public.location", "postcode")});
}

TEST(StrategiesTest, ValidateAgainstDbReportsBothSidesSorted)
{
    Strategies strategies;
    strategies.insert("public.person",
                      {{"first_name", column_info("first_name", DataCategory::General, TransformerType::Identity)},
                       {"age", column_info("age", DataCategory::General, TransformerType::Identity)}});

    DbErrors errors = strategies.validate_against_db({simple_column("public.zoo", "animal"),
                                                      simple_column("public.location", "postcode"),
                                                      simple_column("public.location", "city")});

    EXPECT_EQ(errors.missing_from_strategy_file,
              (std::vector<SimpleColumn>{simple_column("public.location", "city"),
                                         simple_column("public.location", "postcode"),
                                         simple_column("public.zoo", "animal")}));
    EXPECT_EQ(errors.missing_from_db, (std::vector<SimpleColumn>{simple_column("public.person", "age"),
                                                                 simple_column("public.person", "first_name")}));
}

TEST(StrategiesTest, TruncatedTablesTakeNoPartInColumnDiff)
{
    Strategies strategies = person_and_location();
    strategies.insert_truncate("public.sessions");

    DbErrors errors = strategies.validate_against_db({simple_column("public.person", "first_name"),
                                                      simple_column("public.location", "postcode"),
                                                      simple_column("public.sessions", "token")});
    EXPECT_TRUE(errors.is_empty());
}

TEST(StrategiesTest, TruncatedTableMissingFromDbIsReported)
{
    Strategies strategies = person_and_location();
    strategies.insert_truncate("public.sessions");

    DbErrors errors = strategies.validate_against_db(
        {simple_column("public.person", "first_name"), simple_column("public.location", "postcode")});
    EXPECT_EQ(errors.truncated_tables_missing_from_db, std::vector<std::string>{"public.sessions"});
    EXPECT_TRUE(errors.missing_from_db.empty());
    EXPECT_TRUE(errors.missing_from_strategy_file.empty());
}
