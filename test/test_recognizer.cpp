#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

#include "errors.hpp"
#include "recognizer.hpp"

namespace {

using ner::GazetteerRecognizer;

GazetteerRecognizer make_gazetteer() {
    return GazetteerRecognizer({ "Jane", "john", "PRIYA" });
}

TEST(GazetteerRecognizerTest, HonorificIsPartOfName) {
    auto rec = make_gazetteer();
    auto spans = rec.recognize("Contact Dr. Jane Smith at jane.smith@example.com");

    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)8);
    EXPECT_EQ(spans[0].end, (size_t)22);
    EXPECT_EQ(spans[0].label, ner::kPersonLabel);
}

TEST(GazetteerRecognizerTest, RequiresCapitalizedKnownName) {
    auto rec = make_gazetteer();
    EXPECT_TRUE(rec.recognize("jane smith wrote").empty());
    EXPECT_TRUE(rec.recognize("Robert Smith wrote").empty());

    auto spans = rec.recognize("Ask Priya about it");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)4);
    EXPECT_EQ(spans[0].end, (size_t)9);
}

TEST(GazetteerRecognizerTest, NameLengthIsBounded) {
    auto rec = make_gazetteer();
    auto spans = rec.recognize("John Ronald Reuel Tolkien");

    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)0);
    EXPECT_EQ(spans[0].end, (size_t)17);
}

TEST(GazetteerRecognizerTest, StopsAtPunctuationAndPossessive) {
    auto rec = make_gazetteer();

    auto spans = rec.recognize("Hello Jane. Smith is here");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)6);
    EXPECT_EQ(spans[0].end, (size_t)10);

    spans = rec.recognize("Jane's report");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].end, (size_t)4);
}

TEST(GazetteerRecognizerTest, HonorificWithoutSpaceIsNotAbsorbed) {
    auto rec = make_gazetteer();
    auto spans = rec.recognize("Mrs.Jane");

    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)4);
    EXPECT_EQ(spans[0].end, (size_t)8);
}

TEST(GazetteerRecognizerTest, MultipleNames) {
    auto rec = make_gazetteer();
    auto spans = rec.recognize("Jane and John Doe");

    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].start, (size_t)0);
    EXPECT_EQ(spans[0].end, (size_t)4);
    EXPECT_EQ(spans[1].start, (size_t)9);
    EXPECT_EQ(spans[1].end, (size_t)17);
}

TEST(GazetteerRecognizerTest, LoadFromFile) {
    const std::string file = "test_names.txt";
    {
        std::ofstream ofs(file);
        ofs << "# given names\n\nJane\n  John  \n";
    }

    auto rec = GazetteerRecognizer::load_from_file(file);
    EXPECT_EQ(rec->size(), (size_t)2);
    EXPECT_EQ(rec->recognize("John").size(), (size_t)1);

    std::remove(file.c_str());
}

TEST(GazetteerRecognizerTest, MissingOrEmptyListIsUnavailable) {
    EXPECT_THROW(GazetteerRecognizer::load_from_file("no_such_names.txt"), errors::RecognizerUnavailable);

    const std::string file = "test_names_empty.txt";
    {
        std::ofstream ofs(file);
        ofs << "# nothing here\n";
    }
    EXPECT_THROW(GazetteerRecognizer::load_from_file(file), errors::RecognizerUnavailable);
    std::remove(file.c_str());
}

TEST(NullRecognizerTest, FindsNothing) {
    ner::NullRecognizer rec;
    EXPECT_TRUE(rec.recognize("Dr. Jane Smith").empty());
    EXPECT_EQ(rec.name(), "disabled");
}

} // anonymous namespace
