#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "graph/neo4j_session.hpp"

using namespace dbx;

TEST(Neo4jResponseTest, ParsesRowsByColumnName) {
    const std::string body = R"({
        "results": [{
            "columns": ["subj", "pred", "obj"],
            "data": [
                {"row": ["http://s1", "http://p", "http://o1"], "meta": [null, null, null]},
                {"row": ["http://s2", "http://p", "http://o2"], "meta": [null, null, null]}
            ]
        }],
        "errors": []
    })";

    auto result = parse_neo4j_response(body);
    ASSERT_NE(result->peek(), nullptr);
    EXPECT_EQ(result->peek()->require("subj"), "http://s1");

    Record record;
    ASSERT_TRUE(result->next(record));
    EXPECT_EQ(record.require("obj"), "http://o1");
    ASSERT_TRUE(result->next(record));
    EXPECT_EQ(record.require("subj"), "http://s2");
    EXPECT_FALSE(result->next(record));
    EXPECT_EQ(result->peek(), nullptr);
}

TEST(Neo4jResponseTest, NullValuesBecomeEmptyOptionals) {
    const std::string body = R"({
        "results": [{
            "columns": ["label", "description", "depiction"],
            "data": [{"row": ["Berlin", null, null]}]
        }],
        "errors": []
    })";

    auto result = parse_neo4j_response(body);
    Record record;
    ASSERT_TRUE(result->next(record));
    EXPECT_EQ(record.get("label"), std::optional<std::string>("Berlin"));
    EXPECT_FALSE(record.get("description").has_value());
    EXPECT_THROW(record.require("depiction"), DataContractError);
}

TEST(Neo4jResponseTest, NonStringValuesAreRenderedAsJson) {
    const std::string body = R"({
        "results": [{"columns": ["n", "names"], "data": [{"row": [42, ["a", "b"]]}]}],
        "errors": []
    })";

    auto result = parse_neo4j_response(body);
    Record record;
    ASSERT_TRUE(result->next(record));
    EXPECT_EQ(record.require("n"), "42");
    EXPECT_EQ(record.require("names"), R"(["a","b"])");
}

TEST(Neo4jResponseTest, EmptyDataGivesEmptyResult) {
    auto result = parse_neo4j_response(
        R"({"results": [{"columns": ["subj", "pred", "obj"], "data": []}], "errors": []})");
    EXPECT_EQ(result->peek(), nullptr);
}

TEST(Neo4jResponseTest, MissingColumnIsContractViolation) {
    auto result = parse_neo4j_response(
        R"({"results": [{"columns": ["subj"], "data": [{"row": ["s"]}]}], "errors": []})");
    Record record;
    ASSERT_TRUE(result->next(record));
    EXPECT_FALSE(record.has_field("pred"));
    EXPECT_THROW(record.get("pred"), DataContractError);
}

TEST(Neo4jResponseTest, ServerErrorBecomesQueryError) {
    const std::string body = R"({
        "results": [],
        "errors": [{"code": "Neo.ClientError.Statement.SyntaxError", "message": "Invalid input"}]
    })";
    try {
        parse_neo4j_response(body);
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_NE(std::string(e.what()).find("SyntaxError"), std::string::npos);
    }
}

TEST(Neo4jResponseTest, SecurityErrorBecomesConnectionError) {
    const std::string body = R"({
        "results": [],
        "errors": [{"code": "Neo.ClientError.Security.Unauthorized", "message": "bad credentials"}]
    })";
    EXPECT_THROW(parse_neo4j_response(body), ConnectionError);
}

TEST(Neo4jResponseTest, MalformedBodyBecomesQueryError) {
    EXPECT_THROW(parse_neo4j_response("<html>gateway timeout</html>"), QueryError);
    EXPECT_THROW(parse_neo4j_response(R"({"errors": []})"), QueryError);
}

TEST(Neo4jResponseTest, RowWidthMismatchIsContractViolation) {
    EXPECT_THROW(
        parse_neo4j_response(
            R"({"results": [{"columns": ["a", "b"], "data": [{"row": ["x"]}]}], "errors": []})"),
        DataContractError);
}

TEST(Neo4jConfigTest, CommitUrl) {
    Neo4jConfig config;
    config.host = "graph.example.org";
    config.port = 7473;
    config.scheme = "https";
    config.database = "dbpedia";
    EXPECT_EQ(config.commit_url(), "https://graph.example.org:7473/db/dbpedia/tx/commit");
}
