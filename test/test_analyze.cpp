#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "analyze.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

namespace {

using analyze::resolve_overlaps;
using types::Classification;
using types::Span;
using types::SpanSource;

const std::string kContact = "Contact Dr. Jane Smith at jane.smith@example.com or 555-123-4567.";

Span span(size_t start, size_t end, Classification c = Classification::EMAIL,
          SpanSource source = SpanSource::rule("test")) {
    return Span{ start, end, c, std::string(end - start, 'x'), std::move(source) };
}

TEST(SpanCollectorTest, RecognizerFirstThenRulesInOrder) {
    auto recognizer = std::make_shared<test_helpers::StubRecognizer>(std::vector<ner::RecognizedSpan>{
        { 8, 22, "PERSON" },
        { 26, 48, "ORG" }
    });
    analyze::SpanCollector collector(recognizer, test_helpers::default_registry());

    auto candidates = collector.collect(kContact);
    ASSERT_EQ(candidates.size(), (size_t)4);

    EXPECT_EQ(candidates[0].source.kind, SpanSource::Kind::RECOGNIZER);
    EXPECT_EQ(candidates[0].classification, Classification::FULL_NAME);
    EXPECT_EQ(candidates[0].literal, "Dr. Jane Smith");

    EXPECT_EQ(candidates[1].source.rule_name, "full_name");
    EXPECT_EQ(candidates[1].start, (size_t)8);
    EXPECT_EQ(candidates[2].source.rule_name, "email");
    EXPECT_EQ(candidates[2].literal, "jane.smith@example.com");
    EXPECT_EQ(candidates[3].source.rule_name, "phone_number");
    EXPECT_EQ(candidates[3].literal, "555-123-4567");
}

TEST(SpanCollectorTest, KeepsOverlappingCandidates) {
    analyze::SpanCollector collector(std::make_shared<test_helpers::StubRecognizer>(),
                                     test_helpers::default_registry());

    // dob и expiry_no оба находят начало даты
    auto candidates = collector.collect("DOB 12/05/1990");
    ASSERT_EQ(candidates.size(), (size_t)2);
    EXPECT_EQ(candidates[0].classification, Classification::DOB);
    EXPECT_EQ(candidates[1].classification, Classification::EXPIRY_NO);
    EXPECT_EQ(candidates[1].literal, "12/05");
}

TEST(SpanCollectorTest, RecognizerSpanOutsideTextIsRejected) {
    auto recognizer = std::make_shared<test_helpers::StubRecognizer>(std::vector<ner::RecognizedSpan>{
        { 2, 40, "PERSON" }
    });
    analyze::SpanCollector collector(recognizer, test_helpers::default_registry());
    EXPECT_THROW(collector.collect("short text"), errors::RecognizerUnavailable);
}

TEST(SpanCollectorTest, MissingRecognizerIsUnavailable) {
    analyze::SpanCollector collector(nullptr, test_helpers::default_registry());
    EXPECT_THROW(collector.collect("text"), errors::RecognizerUnavailable);
}

TEST(OverlapResolverTest, FirstClaimedWins) {
    std::vector<Span> candidates = {
        span(12, 22, Classification::FULL_NAME, SpanSource::recognizer()),
        span(8, 22, Classification::FULL_NAME, SpanSource::rule("full_name"))
    };
    auto entities = resolve_overlaps(candidates);

    ASSERT_EQ(entities.size(), (size_t)1);
    EXPECT_EQ(entities[0].start, (size_t)12);
    EXPECT_EQ(entities[0].source.kind, SpanSource::Kind::RECOGNIZER);
}

TEST(OverlapResolverTest, TouchingSpansConflict) {
    auto entities = resolve_overlaps({ span(0, 5), span(5, 9) });
    ASSERT_EQ(entities.size(), (size_t)1);
    EXPECT_EQ(entities[0].end, (size_t)5);

    entities = resolve_overlaps({ span(0, 5), span(6, 9) });
    EXPECT_EQ(entities.size(), (size_t)2);
}

TEST(OverlapResolverTest, ContainedAndContainingSpansConflict) {
    auto entities = resolve_overlaps({ span(5, 10), span(0, 20), span(6, 8) });
    ASSERT_EQ(entities.size(), (size_t)1);
    EXPECT_EQ(entities[0].start, (size_t)5);
}

TEST(OverlapResolverTest, DiscardedSpansAreNotRetried) {
    // (4,12) отброшен из-за (0,5), поэтому (10,14) с ним уже не конфликтует
    auto entities = resolve_overlaps({ span(0, 5), span(4, 12), span(10, 14) });
    ASSERT_EQ(entities.size(), (size_t)2);
    EXPECT_EQ(entities[0].start, (size_t)0);
    EXPECT_EQ(entities[1].start, (size_t)10);
}

TEST(OverlapResolverTest, SortsByStart) {
    auto entities = resolve_overlaps({ span(20, 25), span(0, 5), span(10, 15) });
    ASSERT_EQ(entities.size(), (size_t)3);
    EXPECT_EQ(entities[0].start, (size_t)0);
    EXPECT_EQ(entities[1].start, (size_t)10);
    EXPECT_EQ(entities[2].start, (size_t)20);
}

TEST(OverlapResolverTest, EmptyInput) {
    EXPECT_TRUE(resolve_overlaps({}).empty());
}

TEST(OverlapResolverTest, NoTwoEntitiesIntersect) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> pos(0, 200);
    std::uniform_int_distribution<size_t> len(1, 30);

    for (int round = 0; round < 200; ++round) {
        std::vector<Span> candidates;
        for (int i = 0; i < 25; ++i) {
            size_t start = pos(rng);
            candidates.push_back(span(start, start + len(rng)));
        }

        auto entities = resolve_overlaps(candidates);
        ASSERT_FALSE(entities.empty());
        for (size_t i = 0; i < entities.size(); ++i) {
            for (size_t j = i + 1; j < entities.size(); ++j) {
                EXPECT_FALSE(analyze::spans_conflict(entities[j], entities[i]));
                EXPECT_LT(entities[i].end, entities[j].start);
            }
        }
    }
}

} // anonymous namespace
