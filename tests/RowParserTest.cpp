#include "pg_scrub/DumpParseError.hpp"
#include "pg_scrub/RowParser.hpp"

#include "gtest/gtest.h"

namespace
{
ColumnInfo column_info(const std::string &name, DataCategory data_category, TransformerType transformer_type)
{
    return ColumnInfo{name, data_category, Transformer{transformer_type, std::nullopt}};
}

Strategies people_strategies()
{
    Strategies strategies;
    strategies.insert("public.people",
                      {{"id", column_info("id", DataCategory::General, TransformerType::Identity)},
                       {"dob", column_info("dob", DataCategory::Pii, TransformerType::ObfuscateDay)},
                       {"tags", column_info("tags", DataCategory::PotentialPii, TransformerType::Scramble)}});
    strategies.insert_truncate("public.audit_log");
    return strategies;
}
} // namespace

class RowParserTest : public ::testing::Test
{
  protected:
    Strategies strategies_ = people_strategies();
    ValueTransformer transformer_{7u};
    RowParser parser_{strategies_, transformer_};
};

TEST_F(RowParserTest, PassesThroughOrdinaryLines)
{
    EXPECT_EQ(parser_.parse("SET statement_timeout = 0;"), std::optional<std::string>("SET statement_timeout = 0;"));
    EXPECT_EQ(parser_.parse(""), std::optional<std::string>(""));
    EXPECT_TRUE(std::holds_alternative<Normal>(parser_.state().position));
}

TEST_F(RowParserTest, CreateTableBlockRecordsTypes)
{
    parser_.parse("CREATE TABLE public.people (");
    ASSERT_TRUE(std::holds_alternative<InCreateTable>(parser_.state().position));

    parser_.parse("    id bigint NOT NULL,");
    parser_.parse("    dob date,");
    parser_.parse("    tags text[]");
    EXPECT_EQ(std::get<InCreateTable>(parser_.state().position).types.size(), 3u);

    EXPECT_EQ(parser_.parse(");"), std::optional<std::string>(");"));
    EXPECT_TRUE(std::holds_alternative<Normal>(parser_.state().position));
    EXPECT_EQ(parser_.state().types.lookup("public.people", "dob"), std::optional<std::string>("date"));
    EXPECT_EQ(parser_.state().types.lookup("public.people", "tags"), std::optional<std::string>("text[]"));
}

TEST_F(RowParserTest, CopyBlockTransformsRows)
{
    parser_.parse("CREATE TABLE public.people (");
    parser_.parse("    id bigint NOT NULL,");
    parser_.parse("    dob date,");
    parser_.parse("    tags text[]");
    parser_.parse(");");

    const std::string header = "COPY public.people (id, dob, tags) FROM stdin;";
    EXPECT_EQ(parser_.parse(header), std::optional<std::string>(header));
    ASSERT_TRUE(std::holds_alternative<InCopy>(parser_.state().position));

    auto row = parser_.parse("1\t1984-06-23\t{abc,\"d e\",NULL}");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->substr(0, 13), "1\t1984-06-01\t");

    std::string tags = row->substr(13);
    EXPECT_EQ(tags.front(), '{');
    EXPECT_EQ(tags.back(), '}');
    EXPECT_NE(tags.find(",NULL}"), std::string::npos);
    EXPECT_EQ(tags.size(), std::string("{abc,\"d e\",NULL}").size());

    EXPECT_EQ(parser_.parse("\\."), std::optional<std::string>("\\."));
    EXPECT_TRUE(std::holds_alternative<Normal>(parser_.state().position));
    EXPECT_EQ(parser_.rows_transformed(), 1u);
}

TEST_F(RowParserTest, MissingTypesDegradeToScalarHandling)
{
    parser_.parse("COPY public.people (id, dob, tags) FROM stdin;");
    auto row = parser_.parse("2\t2001-02-03\tplain");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->substr(0, 13), "2\t2001-02-01\t");
    EXPECT_EQ(row->size(), std::string("2\t2001-02-03\tplain").size());
}

TEST_F(RowParserTest, TruncatedTableRowsAreDropped)
{
    const std::string header = "COPY public.audit_log (id, message) FROM stdin;";
    EXPECT_EQ(parser_.parse(header), std::optional<std::string>(header));
    EXPECT_EQ(parser_.parse("1\tlogged in"), std::nullopt);
    EXPECT_EQ(parser_.parse("2\tlogged out"), std::nullopt);
    EXPECT_EQ(parser_.parse("\\."), std::optional<std::string>("\\."));
    EXPECT_EQ(parser_.rows_dropped(), 2u);
}

TEST_F(RowParserTest, UndeclaredTableIsFatal)
{
    EXPECT_THROW(parser_.parse("COPY public.secrets (id, value) FROM stdin;"), DumpParseError);
    EXPECT_TRUE(std::holds_alternative<Normal>(parser_.state().position));
}

TEST_F(RowParserTest, MalformedRowIsFatal)
{
    parser_.parse("COPY public.people (id, dob, tags) FROM stdin;");
    EXPECT_THROW(parser_.parse("1\t1984-06-23"), DumpParseError);
    EXPECT_THROW(parser_.parse("1\t1984-06-23\tbad\\escape"), DumpParseError);
}
