#include <gtest/gtest.h>
#include "shell/ArgumentPrompter.hpp"
#include <sstream>

using namespace mcp_inspector;

class ArgumentPrompterTest : public ::testing::Test {
protected:
    json prompt_with(const std::string& input, const json& schema) {
        in_.str(input);
        in_.clear();
        ArgumentPrompter prompter(in_, out_);
        return prompter.prompt(schema);
    }

    std::istringstream in_;
    std::ostringstream out_;
};

TEST_F(ArgumentPrompterTest, NoPropertiesMeansEmptyArguments) {
    json args = prompt_with("", json{{"type", "object"}});

    EXPECT_EQ(args, json::object());
    EXPECT_NE(out_.str().find("no parameters"), std::string::npos);
}

TEST_F(ArgumentPrompterTest, RequiredValuesAreCoercedByType) {
    json schema = {
        {"type", "object"},
        {"properties", {
            {"city", {{"type", "string"}}},
            {"days", {{"type", "integer"}}},
            {"metric", {{"type", "boolean"}}}
        }},
        {"required", json::array({"city", "days", "metric"})}
    };

    // Properties are asked in key order: city, days, metric
    json args = prompt_with("Paris\n3\nyes\n", schema);

    EXPECT_EQ(args["city"], "Paris");
    EXPECT_EQ(args["days"], 3);
    EXPECT_EQ(args["metric"], true);
    EXPECT_NE(out_.str().find("Enter value for city (type=string) [required]: "), std::string::npos);
}

TEST_F(ArgumentPrompterTest, BlankRequiredValueUsesInferredDefault) {
    json schema = {
        {"properties", {{"count", {{"type", "integer"}}}, {"tags", {{"type", "array"}}}}},
        {"required", json::array({"count", "tags"})}
    };

    json args = prompt_with("\n\n", schema);

    EXPECT_EQ(args["count"], 0);
    EXPECT_EQ(args["tags"], json::array());
}

TEST_F(ArgumentPrompterTest, BlankOptionalValueIsOmittedUnlessDefaulted) {
    json schema = {
        {"properties", {
            {"limit", {{"type", "integer"}, {"default", 10}}},
            {"name", {{"type", "string"}}},
            {"query", {{"type", "string"}}}
        }},
        {"required", json::array({"query"})}
    };

    json args = prompt_with("\n\nweather\n", schema);

    EXPECT_EQ(args["limit"], 10);
    EXPECT_FALSE(args.contains("name"));
    EXPECT_EQ(args["query"], "weather");
}

TEST_F(ArgumentPrompterTest, AllOptionalDeclinedFillsDefaults) {
    json schema = {
        {"properties", {
            {"verbose", {{"type", "boolean"}}},
            {"depth", {{"type", "number"}, {"default", 2.5}}}
        }}
    };

    json args = prompt_with("\n", schema);

    EXPECT_EQ(args["verbose"], false);
    EXPECT_EQ(args["depth"], 2.5);
    EXPECT_NE(out_.str().find("Enter values? [y/N]"), std::string::npos);
}

TEST_F(ArgumentPrompterTest, AllOptionalAcceptedPromptsEach) {
    json schema = {
        {"properties", {{"verbose", {{"type", "boolean"}}}}}
    };

    json args = prompt_with("y\nfalse\n", schema);

    EXPECT_EQ(args["verbose"], false);
    EXPECT_NE(out_.str().find("[optional]"), std::string::npos);
}

TEST_F(ArgumentPrompterTest, UsesTitleInPrompt) {
    json schema = {
        {"properties", {{"q", {{"type", "string"}, {"title", "Search query"}}}}},
        {"required", json::array({"q"})}
    };

    prompt_with("x\n", schema);

    EXPECT_NE(out_.str().find("Enter value for Search query"), std::string::npos);
}

TEST_F(ArgumentPrompterTest, CoerceParsesJsonFirst) {
    EXPECT_EQ(ArgumentPrompter::coerce("[1,2]", json{{"type", "array"}}), json::array({1, 2}));
    EXPECT_EQ(ArgumentPrompter::coerce("{\"a\":1}", json{{"type", "object"}}), json({{"a", 1}}));
    EXPECT_EQ(ArgumentPrompter::coerce("7", json::object()), 7);
}

TEST_F(ArgumentPrompterTest, CoerceKeepsStringsVerbatim) {
    EXPECT_EQ(ArgumentPrompter::coerce("42", json{{"type", "string"}}), "42");
    EXPECT_EQ(ArgumentPrompter::coerce("hello world", json::object()), "hello world");
}

TEST_F(ArgumentPrompterTest, CoerceFallsBackOnBadNumbers) {
    EXPECT_EQ(ArgumentPrompter::coerce("abc", json{{"type", "integer"}}), 0);
    EXPECT_EQ(ArgumentPrompter::coerce("abc", json{{"type", "number"}}), 0.0);
    EXPECT_EQ(ArgumentPrompter::coerce("Y", json{{"type", "boolean"}}), true);
    EXPECT_EQ(ArgumentPrompter::coerce("nope", json{{"type", "boolean"}}), false);
}

TEST_F(ArgumentPrompterTest, InferDefaultByType) {
    EXPECT_EQ(ArgumentPrompter::infer_default(json{{"type", "integer"}}), 0);
    EXPECT_EQ(ArgumentPrompter::infer_default(json{{"type", "object"}}), json::object());
    EXPECT_EQ(ArgumentPrompter::infer_default(json{{"type", "string"}}), "");
    EXPECT_EQ(ArgumentPrompter::infer_default(json{{"type", "string"}, {"default", "x"}}), "x");
    EXPECT_EQ(ArgumentPrompter::infer_default(json::object()), "");
}
