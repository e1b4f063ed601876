#include <gtest/gtest.h>

#include "Errors.hpp"
#include "PromptTemplate.hpp"

using namespace flowgraph;

TEST(PromptTemplateTests, SubstitutesAllPlaceholderSpellings) {
    PromptTemplate tmpl("Trip to {{destination}} for {{ nights }} nights, from {{.origin}}.");
    json::object vars{{"destination", "Kyoto"}, {"nights", 5}, {"origin", "Seoul"}};

    EXPECT_EQ(tmpl.Render(vars), "Trip to Kyoto for 5 nights, from Seoul.");
}

TEST(PromptTemplateTests, DottedPathsWalkNestedObjects) {
    PromptTemplate tmpl("Budget: {{trip.budget.amount}} {{trip.budget.currency}}");
    json::object vars{
        {"trip", json::object{{"budget", json::object{{"amount", 1200}, {"currency", "EUR"}}}}}};

    EXPECT_EQ(tmpl.Render(vars), "Budget: 1200 EUR");
}

TEST(PromptTemplateTests, NonStringValuesRenderAsJson) {
    PromptTemplate tmpl("{{list}} / {{flag}} / {{obj}}");
    json::object vars{
        {"list", json::array{1, "a"}}, {"flag", false}, {"obj", json::object{{"k", nullptr}}}};

    EXPECT_EQ(tmpl.Render(vars), R"([1,"a"] / false / {"k":null})");
}

TEST(PromptTemplateTests, UnresolvedPlaceholderIsNotFound) {
    PromptTemplate tmpl("Hello {{name}}");
    EXPECT_THROW(tmpl.Render({}), NotFoundError);

    PromptTemplate nested("{{a.b}}");
    EXPECT_THROW(nested.Render({{"a", "not an object"}}), NotFoundError);
}

TEST(PromptTemplateTests, MalformedTemplatesAreRejected) {
    EXPECT_THROW(PromptTemplate("Hello {{name"), ValidationError);
    EXPECT_THROW(PromptTemplate("Hello {{  }}"), ValidationError);
    EXPECT_THROW(PromptTemplate("Hello {{.}}"), ValidationError);
}

TEST(PromptTemplateTests, VariablesAreDistinctInOrder) {
    PromptTemplate tmpl("{{b}} {{a}} {{ b }} plain text");
    std::vector<std::string> expected{"b", "a"};
    EXPECT_EQ(tmpl.Variables(), expected);

    PromptTemplate literal("no placeholders at all");
    EXPECT_TRUE(literal.Variables().empty());
    EXPECT_EQ(literal.Render({}), "no placeholders at all");
}
