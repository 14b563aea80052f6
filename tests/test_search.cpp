/**
 * Search Tests
 *
 * Covers:
 * - Concept search scoring: exact label, label prefix, label substring, local name,
 *   IRI, comment
 * - Ranking, one result per IRI, limit, blank queries
 * - Lexical prefix search over subjects and predicates
 */

#include "test_graphs.h"

#include <semgraph/ontology/concept_extractor.h>
#include <semgraph/ontology/concept_search.h>
#include <semgraph/ontology/lexical_search.h>
#include <gtest/gtest.h>
#include <algorithm>

using namespace semgraph;
using namespace semgraph::ontology;
using namespace semgraph::testing;

namespace {

Concept MakeConcept(const std::string& iri, std::optional<std::string> label,
                    std::optional<std::string> comment = std::nullopt) {
    Concept c;
    c.iri = iri;
    c.label = std::move(label);
    c.comment = std::move(comment);
    return c;
}

std::vector<std::string> ResultIris(const std::vector<SearchResult>& results) {
    std::vector<std::string> iris;
    for (const auto& r : results) {
        iris.push_back(r.item.iri);
    }
    return iris;
}

}  // namespace

TEST(ConceptSearchTest, ScoresEachKindOfMatch) {
    struct Case {
        Concept concept_value;
        std::string query;
        double score;
        MatchType type;
    };
    std::vector<Case> cases = {
        {MakeConcept("urn:x:a", "Revenue"), "revenue", RelevanceScores::kExactLabel,
         MatchType::Label},
        {MakeConcept("urn:x:b", "Revenue Stream"), "REV", RelevanceScores::kLabelPrefix,
         MatchType::Label},
        {MakeConcept("urn:x:c", "Net Revenue"), "revenue", RelevanceScores::kLabelSubstring,
         MatchType::Label},
        {MakeConcept("http://example.org/onto/FelineThing", "Whiskers"), "feline",
         RelevanceScores::kLocalName, MatchType::Iri},
        {MakeConcept("http://example.org/zoo/Lion", "Leo"), "zoo", RelevanceScores::kIri,
         MatchType::Iri},
        {MakeConcept("urn:x:d", "Other", "Income from sales"), "sales",
         RelevanceScores::kComment, MatchType::Comment},
    };

    for (const auto& c : cases) {
        auto result = ScoreConcept(c.concept_value, c.query);
        ASSERT_TRUE(result.has_value()) << c.query;
        EXPECT_DOUBLE_EQ(result->relevance_score, c.score) << c.query;
        EXPECT_EQ(result->match_type, c.type) << c.query;
        EXPECT_EQ(result->item.iri, c.concept_value.iri);
    }

    EXPECT_FALSE(ScoreConcept(MakeConcept("urn:x:e", "Cost"), "revenue").has_value());
    EXPECT_FALSE(ScoreConcept(MakeConcept("urn:x:e", "Cost"), "   ").has_value());
}

TEST(ConceptSearchTest, LabelMatchesOutrankComments) {
    std::vector<Concept> concepts = {
        MakeConcept("urn:x:lover", "Owner", "A cat lover"),
        MakeConcept("urn:x:cat", "Cat"),
        MakeConcept("urn:x:catalog", "Catalog"),
    };
    auto results = SearchConcepts(concepts, "cat", 10);
    EXPECT_EQ(ResultIris(results),
              (std::vector<std::string>{"urn:x:cat", "urn:x:catalog", "urn:x:lover"}));
    EXPECT_DOUBLE_EQ(results[0].relevance_score, RelevanceScores::kExactLabel);
    EXPECT_EQ(results[2].match_type, MatchType::Comment);
}

TEST(ConceptSearchTest, TiesOrderByLabelThenIri) {
    std::vector<Concept> concepts = {
        MakeConcept("urn:x:2", "Mammal"),
        MakeConcept("urn:x:1", "Animal"),
        MakeConcept("urn:x:0", "Animal"),
    };
    auto results = SearchConcepts(concepts, "al", 10);
    EXPECT_EQ(ResultIris(results), (std::vector<std::string>{"urn:x:0", "urn:x:1", "urn:x:2"}));
}

TEST(ConceptSearchTest, OneResultPerIriWithBestScore) {
    std::vector<Concept> concepts = {
        MakeConcept("urn:x:dog", std::nullopt, "A dog"),
        MakeConcept("urn:x:dog", "Dog"),
    };
    auto results = SearchConcepts(concepts, "dog", 10);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].relevance_score, RelevanceScores::kExactLabel);
    EXPECT_EQ(results[0].item.label, "Dog");
}

TEST(ConceptSearchTest, LimitAndBlankQuery) {
    ConceptExtractor extractor(BuildTurtleStore({{"animals", kAnimals}}));
    auto concepts = extractor.GetMergedConcepts();

    EXPECT_EQ(SearchConcepts(concepts, "urn:x", 2).size(), 2u);
    EXPECT_EQ(SearchConcepts(concepts, "urn:x", 50).size(), 5u);
    EXPECT_TRUE(SearchConcepts(concepts, "", 50).empty());
    EXPECT_TRUE(SearchConcepts(concepts, "dog", 0).empty());

    auto canine = SearchConcepts(concepts, "canine", 50);
    ASSERT_EQ(canine.size(), 1u);
    EXPECT_EQ(canine[0].item.iri, "urn:x:Dog");
    EXPECT_EQ(canine[0].match_type, MatchType::Comment);
}

TEST(PrefixSearchTest, SubjectsAndPredicates) {
    auto store = BuildTurtleStore({{"animals", kAnimals}});

    auto owner = PrefixSearch(*store, "OWNER", 25);
    ASSERT_EQ(owner.size(), 1u);
    EXPECT_EQ(owner[0].value, "urn:x:hasOwner");
    EXPECT_EQ(owner[0].type, LexicalMatchType::Property);

    auto rex = PrefixSearch(*store, "rex", 25);
    ASSERT_EQ(rex.size(), 1u);
    EXPECT_EQ(rex[0].type, LexicalMatchType::Resource);

    // objects alone are not searched
    EXPECT_TRUE(PrefixSearch(*store, "alice", 25).empty());

    auto label = PrefixSearch(*store, "rdf-schema#label", 25);
    ASSERT_EQ(label.size(), 1u);
    EXPECT_EQ(label[0].type, LexicalMatchType::Property);
}

TEST(PrefixSearchTest, LimitDedupAndBlankSubjects) {
    auto store = BuildTurtleStore({
        {"a", "x:item1 x:p x:o .\nx:item2 x:p x:o .\n_:blanky x:p x:o .\n"},
        {"b", "x:item1 x:q x:o .\nx:item3 x:q x:o .\n"},
    });

    auto all = PrefixSearch(*store, "item", 25);
    std::vector<std::string> values;
    for (const auto& match : all) {
        values.push_back(match.value);
    }
    EXPECT_EQ(values, (std::vector<std::string>{"urn:x:item1", "urn:x:item2", "urn:x:item3"}));

    EXPECT_EQ(PrefixSearch(*store, "item", 2).size(), 2u);
    EXPECT_TRUE(PrefixSearch(*store, "blanky", 25).empty());
    EXPECT_TRUE(PrefixSearch(*store, "item", 0).empty());
}
