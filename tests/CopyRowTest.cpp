#include "pg_scrub/CopyRow.hpp"
#include "pg_scrub/DumpParseError.hpp"
#include "pg_scrub/Strategies.hpp"
#include "pg_scrub/Types.hpp"
#include "pg_scrub/ValueTransformer.hpp"

#include "gtest/gtest.h"

namespace
{
ColumnInfo column_info(const std::string &name, DataCategory data_category, TransformerType transformer_type)
{
    return ColumnInfo{name, data_category, Transformer{transformer_type, std::nullopt}};
}

Strategies users_strategies()
{
    Strategies strategies;
    strategies.insert("public.users", {{"id", column_info("id", DataCategory::General, TransformerType::Identity)},
                                       {"first_name", column_info("first_name", DataCategory::Pii,
                                                                  TransformerType::FakeFirstName)},
                                       {"notes", column_info("notes", DataCategory::General,
                                                             TransformerType::Identity)}});
    strategies.insert_truncate("public.sessions");
    return strategies;
}
} // namespace

TEST(CopyRowTest, ParsesHeader)
{
    auto header = CopyRow::parse_header("COPY public.users (id, email, first_name) FROM stdin;");
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->table_name, "public.users");
    EXPECT_EQ(header->columns, (std::vector<std::string>{"id", "email", "first_name"}));
}

TEST(CopyRowTest, ParsesQuotedColumns)
{
    auto header = CopyRow::parse_header("COPY public.\"Users\" (id, \"First Name\", \"a,b\") FROM stdin;");
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->table_name, "public.Users");
    EXPECT_EQ(header->columns, (std::vector<std::string>{"id", "First Name", "a,b"}));
}

TEST(CopyRowTest, IgnoresOtherLines)
{
    EXPECT_FALSE(CopyRow::parse_header("SELECT pg_catalog.setval('public.orders_id_seq', 8, true);").has_value());
    EXPECT_FALSE(CopyRow::parse_header("COPY public.users (id) TO stdout;").has_value());
}

TEST(CopyRowTest, RecognisesEndOfData)
{
    EXPECT_TRUE(CopyRow::is_end("\\."));
    EXPECT_FALSE(CopyRow::is_end("1\t\\.x"));
}

TEST(CopyRowTest, BindsTransformersInCopyOrder)
{
    CopyRow::Header header{"public.users", {"first_name", "id"}};
    CurrentTableTransforms bound = CopyRow::bind(header, users_strategies());

    ASSERT_TRUE(bound.transforms.has_value());
    ASSERT_EQ(bound.transforms->size(), 2u);
    EXPECT_EQ((*bound.transforms)[0].name, TransformerType::FakeFirstName);
    EXPECT_EQ((*bound.transforms)[1].name, TransformerType::Identity);
}

TEST(CopyRowTest, BindingUnknownTableFails)
{
    CopyRow::Header header{"public.secrets", {"id"}};
    EXPECT_THROW(CopyRow::bind(header, users_strategies()), DumpParseError);
}

TEST(CopyRowTest, BindingUnknownColumnFails)
{
    CopyRow::Header header{"public.users", {"id", "password"}};
    EXPECT_THROW(CopyRow::bind(header, users_strategies()), DumpParseError);
}

TEST(CopyRowTest, TruncatedTableDropsRows)
{
    CurrentTableTransforms bound = CopyRow::bind(CopyRow::Header{"public.sessions", {"id", "token"}},
                                                 users_strategies());
    EXPECT_FALSE(bound.transforms.has_value());

    ValueTransformer transformer(42);
    EXPECT_EQ(CopyRow::transform_row("1\tsecret", bound, Types(), transformer), std::nullopt);
}

TEST(CopyRowTest, IdentityColumnsKeepExactBytes)
{
    CurrentTableTransforms bound = CopyRow::bind(CopyRow::Header{"public.users", {"id", "notes"}},
                                                 users_strategies());
    ValueTransformer transformer(42);

    const std::string line = "7\tline\\none\\ttab \\\\N back\\\\slash";
    EXPECT_EQ(CopyRow::transform_row(line, bound, Types(), transformer), std::optional<std::string>(line));
    EXPECT_EQ(CopyRow::transform_row("8\t\\N", bound, Types(), transformer),
              std::optional<std::string>("8\t\\N"));
}

TEST(CopyRowTest, IdentityColumnsKeepRawControlBytes)
{
    CurrentTableTransforms bound = CopyRow::bind(CopyRow::Header{"public.users", {"id", "notes"}},
                                                 users_strategies());
    ValueTransformer transformer(42);

    const std::string line = "9\tbell\bform\ffeed\vtab";
    EXPECT_EQ(CopyRow::transform_row(line, bound, Types(), transformer), std::optional<std::string>(line));
}

TEST(CopyRowTest, IdentityColumnsStillRejectBadEscapes)
{
    CurrentTableTransforms bound = CopyRow::bind(CopyRow::Header{"public.users", {"id", "notes"}},
                                                 users_strategies());
    ValueTransformer transformer(42);

    EXPECT_THROW(CopyRow::transform_row("9\toctal \\101", bound, Types(), transformer), DumpParseError);
}

TEST(CopyRowTest, TransformsBoundColumns)
{
    CurrentTableTransforms bound = CopyRow::bind(CopyRow::Header{"public.users", {"id", "first_name"}},
                                                 users_strategies());
    ValueTransformer transformer(42);

    auto row = CopyRow::transform_row("1\tZebedee", bound, Types(), transformer);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->substr(0, 2), "1\t");
    EXPECT_NE(*row, "1\tZebedee");
}

TEST(CopyRowTest, FieldCountMismatchFails)
{
    CurrentTableTransforms bound = CopyRow::bind(CopyRow::Header{"public.users", {"id", "first_name"}},
                                                 users_strategies());
    ValueTransformer transformer(42);

    EXPECT_THROW(CopyRow::transform_row("1", bound, Types(), transformer), DumpParseError);
    EXPECT_THROW(CopyRow::transform_row("1\ta\tb", bound, Types(), transformer), DumpParseError);
}
