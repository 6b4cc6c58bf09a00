#include <gtest/gtest.h>
#include <doc_structure/json_serializer.h>

using namespace doc_structure;

class JsonSerializerTest : public ::testing::Test {
protected:
    DocumentStructure CreateMockStructure() {
        Section section;
        section.id = "chapter-0-section-0";
        section.title = "Content";
        section.content = "Osmosis is defined as the movement of water.";
        section.start_page = 1;
        section.end_page = 2;
        section.concepts = {"Osmosis"};
        section.estimated_tokens = 12;

        Chapter chapter;
        chapter.id = "chapter-0";
        chapter.title = "Chapter 1 Cells";
        chapter.sections.push_back(section);
        chapter.start_page = 1;
        chapter.end_page = 2;
        chapter.estimated_tokens = 12;

        DocumentStructure structure;
        structure.title = "Biology";
        structure.chapters.push_back(chapter);
        structure.table_of_contents.push_back(TOCEntry{"Cells", 1, 0, "toc-0"});
        structure.total_pages = 2;
        structure.estimated_tokens = 12;
        return structure;
    }
};

TEST_F(JsonSerializerTest, DocumentFields) {
    auto json = JsonSerializer::to_json(CreateMockStructure());

    EXPECT_EQ(json["title"], "Biology");
    EXPECT_FALSE(json.contains("author"));
    EXPECT_EQ(json["totalPages"], 2);
    EXPECT_EQ(json["estimatedTokens"], 12);

    ASSERT_EQ(json["tableOfContents"].size(), 1u);
    EXPECT_EQ(json["tableOfContents"][0]["title"], "Cells");
    EXPECT_EQ(json["tableOfContents"][0]["pageNumber"], 1);
    EXPECT_EQ(json["tableOfContents"][0]["level"], 0);
    EXPECT_EQ(json["tableOfContents"][0]["id"], "toc-0");
}

TEST_F(JsonSerializerTest, ChapterAndSectionFields) {
    auto json = JsonSerializer::to_json(CreateMockStructure());

    ASSERT_EQ(json["chapters"].size(), 1u);
    const auto& chapter = json["chapters"][0];
    EXPECT_EQ(chapter["id"], "chapter-0");
    EXPECT_EQ(chapter["title"], "Chapter 1 Cells");
    EXPECT_EQ(chapter["startPage"], 1);
    EXPECT_EQ(chapter["endPage"], 2);
    EXPECT_EQ(chapter["estimatedTokens"], 12);

    ASSERT_EQ(chapter["sections"].size(), 1u);
    const auto& section = chapter["sections"][0];
    EXPECT_EQ(section["id"], "chapter-0-section-0");
    EXPECT_EQ(section["content"], "Osmosis is defined as the movement of water.");
    EXPECT_TRUE(section["subsections"].is_array());
    EXPECT_TRUE(section["subsections"].empty());
    EXPECT_EQ(section["concepts"], nlohmann::json::array({"Osmosis"}));
}

TEST_F(JsonSerializerTest, AuthorWhenPresent) {
    auto structure = CreateMockStructure();
    structure.author = "A. Writer";
    EXPECT_EQ(JsonSerializer::to_json(structure)["author"], "A. Writer");
}

TEST_F(JsonSerializerTest, SerializeProducesValidJson) {
    auto structure = CreateMockStructure();

    for (bool pretty : {true, false}) {
        std::string serialized = JsonSerializer::serialize(structure, pretty);
        nlohmann::json parsed;
        ASSERT_NO_THROW(parsed = nlohmann::json::parse(serialized));
        EXPECT_EQ(parsed, JsonSerializer::to_json(structure));
    }
}

TEST_F(JsonSerializerTest, InvalidUtf8IsReplaced) {
    auto structure = CreateMockStructure();
    structure.chapters[0].sections[0].content = "broken \xFF byte";

    std::string serialized;
    ASSERT_NO_THROW(serialized = JsonSerializer::serialize(structure));
    EXPECT_NO_THROW(nlohmann::json::parse(serialized));
}

TEST_F(JsonSerializerTest, EmptyDocument) {
    DocumentStructure empty;
    empty.title = "Untitled Document";

    auto json = JsonSerializer::to_json(empty);
    EXPECT_TRUE(json["chapters"].is_array());
    EXPECT_TRUE(json["chapters"].empty());
    EXPECT_TRUE(json["tableOfContents"].empty());
    EXPECT_EQ(json["totalPages"], 0);
}
