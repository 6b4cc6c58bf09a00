#include <gtest/gtest.h>
#include <doc_structure/chapter_processor.h>
#include <doc_structure/token_estimator.h>
#include "fake_providers.h"

using namespace doc_structure;
using fakes::page;
using fakes::run;

namespace {

std::vector<Page> sectioned_chapter() {
    return {
        page(10, {run("Intro text here")}),
        page(11, {run("2.1 Cells", 14.0f, "Bold"), run("Cells are small.")}),
        page(12, {run("More about cells.")}),
        page(13, {run("SUMMARY", 16.0f, "Bold"), run("Osmosis is defined as diffusion of water.")}),
    };
}

} // namespace

TEST(SectionSplitterTest, ChapterWithoutHeadingsIsOneContentSection) {
    std::vector<Page> pages = {
        page(1, {run("Plain prose.")}),
        page(2, {run("Still plain prose.")}),
        page(3, {run("The end.")}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].title, "Content");
    EXPECT_EQ(sections[0].start_page, 0);
    EXPECT_EQ(sections[0].end_page, 2);
    EXPECT_EQ(sections[0].content, "Plain prose.\nStill plain prose.\nThe end.");
}

TEST(SectionSplitterTest, EmptyPageIsOneContentSection) {
    auto sections = split_into_sections({page(1, {})});
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].title, "Content");
    EXPECT_EQ(sections[0].start_page, 0);
    EXPECT_EQ(sections[0].end_page, 0);
    EXPECT_TRUE(sections[0].content.empty());
}

TEST(SectionSplitterTest, HeadingCandidatesStartNewSections) {
    auto sections = split_into_sections(sectioned_chapter());
    ASSERT_EQ(sections.size(), 3u);

    // The accumulator prefixes every appended page with a newline
    EXPECT_EQ(sections[0].title, "");
    EXPECT_EQ(sections[0].content, "\nIntro text here");
    EXPECT_EQ(sections[0].start_page, 0);
    EXPECT_EQ(sections[0].end_page, 0);

    EXPECT_EQ(sections[1].title, "2.1 Cells");
    EXPECT_EQ(sections[1].content, "2.1 Cells Cells are small.\nMore about cells.");
    EXPECT_EQ(sections[1].start_page, 1);
    EXPECT_EQ(sections[1].end_page, 2);

    EXPECT_EQ(sections[2].title, "SUMMARY");
    EXPECT_EQ(sections[2].content, "SUMMARY Osmosis is defined as diffusion of water.");
    EXPECT_EQ(sections[2].start_page, 3);
    EXPECT_EQ(sections[2].end_page, 3);
}

TEST(SectionSplitterTest, HeadingOnFirstPageDoesNotSplit) {
    std::vector<Page> pages = {
        page(1, {run("1.1 Opening", 14.0f, "Bold"), run("Text.")}),
        page(2, {run("More text.")}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].title, "");
    EXPECT_EQ(sections[0].content, "\n1.1 Opening Text.\nMore text.");
    EXPECT_EQ(sections[0].start_page, 0);
    EXPECT_EQ(sections[0].end_page, 1);
}

TEST(SectionSplitterTest, BlankCoverPageDoesNotSwallowFirstHeading) {
    std::vector<Page> pages = {
        page(1, {}),
        page(2, {run("INTRODUCTION", 16.0f, "Bold"), run("Opening words.", 10.0f)}),
        page(3, {run("Further words.", 10.0f)}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 2u);

    EXPECT_EQ(sections[0].title, "");
    EXPECT_EQ(sections[0].content, "\n");
    EXPECT_EQ(sections[0].start_page, 0);
    EXPECT_EQ(sections[0].end_page, 0);

    EXPECT_EQ(sections[1].title, "INTRODUCTION");
    EXPECT_EQ(sections[1].content, "INTRODUCTION Opening words.\nFurther words.");
    EXPECT_EQ(sections[1].start_page, 1);
    EXPECT_EQ(sections[1].end_page, 2);
}

TEST(SectionSplitterTest, BlankPageInsideSectionKeepsItsNewline) {
    std::vector<Page> pages = {
        page(1, {run("Intro.")}),
        page(2, {run("1.2 Methods", 14.0f, "Bold")}),
        page(3, {}),
        page(4, {run("Results.")}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[1].content, "1.2 Methods\n\nResults.");
    EXPECT_EQ(sections[1].start_page, 1);
    EXPECT_EQ(sections[1].end_page, 3);
}

TEST(SectionSplitterTest, HugeRunTextIsScannedSafely) {
    std::vector<Page> pages = {
        page(1, {run("Intro.")}),
        page(2, {run(std::string(200000, 'A'), 16.0f)}),
        page(3, {run("Chapter" + std::string(200000, ' ') + "9", 16.0f)}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[1].title.size(), 200000u);
    EXPECT_EQ(sections[1].end_page, 2);
}

TEST(SectionSplitterTest, SmallFontHeadingsAreIgnored) {
    std::vector<Page> pages = {
        page(1, {run("Text.")}),
        page(2, {run("2.2 Footnote style", 12.0f), run("Text.")}),
        page(3, {run("GLOSSARY", 10.0f)}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].title, "Content");
    EXPECT_EQ(sections[0].end_page, 2);
}

TEST(SectionSplitterTest, MixedCaseLineIsNotAHeading) {
    std::vector<Page> pages = {
        page(1, {run("Text.")}),
        page(2, {run("Summary Of Results", 16.0f)}),
    };

    auto sections = split_into_sections(pages);
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].title, "Content");
}

TEST(ChapterTitleTest, JoinsLargeRunsOfFirstPage) {
    std::vector<Page> pages = {
        page(1, {run("  Chapter 3", 20.0f), run("body", 11.0f), run("Metabolism  ", 18.0f)}),
        page(2, {run("Ignored", 30.0f)}),
    };
    EXPECT_EQ(derive_chapter_title(pages), "Chapter 3 Metabolism");
}

TEST(ChapterTitleTest, DefaultsWhenNoLargeText) {
    EXPECT_EQ(derive_chapter_title({page(1, {run("small", 14.0f)})}), "Chapter");
    EXPECT_EQ(derive_chapter_title({page(1, {run("   ", 20.0f)})}), "Chapter");
    EXPECT_EQ(derive_chapter_title({}), "Chapter");
}

TEST(ChapterTitleTest, TruncatesToHundredCharacters) {
    std::string long_title(150, 'x');
    EXPECT_EQ(derive_chapter_title({page(1, {run(long_title, 20.0f)})}), std::string(100, 'x'));

    std::string accented;
    for (int i = 0; i < 150; ++i) accented += "\xC3\xA9";  // U+00E9
    std::string title = derive_chapter_title({page(1, {run(accented, 20.0f)})});
    EXPECT_EQ(title.size(), 200u);
    EXPECT_EQ(title, accented.substr(0, 200));
}

TEST(ChapterProcessorTest, BuildsSectionsWithAbsolutePages) {
    auto chapter = process_chapter(sectioned_chapter(), 10, "chapter-2");

    EXPECT_EQ(chapter.id, "chapter-2");
    EXPECT_EQ(chapter.title, "Chapter");
    EXPECT_EQ(chapter.start_page, 10);
    EXPECT_EQ(chapter.end_page, 13);

    ASSERT_EQ(chapter.sections.size(), 3u);
    EXPECT_EQ(chapter.sections[0].id, "chapter-2-section-0");
    EXPECT_EQ(chapter.sections[0].title, "Section 1");
    EXPECT_EQ(chapter.sections[0].content, "\nIntro text here");
    EXPECT_EQ(chapter.sections[0].estimated_tokens, 4);  // 16 characters
    EXPECT_EQ(chapter.sections[0].start_page, 10);
    EXPECT_EQ(chapter.sections[0].end_page, 10);

    EXPECT_EQ(chapter.sections[1].id, "chapter-2-section-1");
    EXPECT_EQ(chapter.sections[1].title, "2.1 Cells");
    EXPECT_EQ(chapter.sections[1].start_page, 11);
    EXPECT_EQ(chapter.sections[1].end_page, 12);

    EXPECT_EQ(chapter.sections[2].start_page, 13);
    EXPECT_EQ(chapter.sections[2].end_page, 13);
    EXPECT_EQ(chapter.sections[2].concepts, std::vector<std::string>({"Osmosis"}));

    int token_sum = 0;
    for (const auto& section : chapter.sections) {
        EXPECT_TRUE(section.subsections.empty());
        EXPECT_EQ(section.estimated_tokens, estimate_tokens(section.content));
        token_sum += section.estimated_tokens;
    }
    EXPECT_EQ(chapter.estimated_tokens, token_sum);
}

TEST(ChapterProcessorTest, SinglePageWithoutRuns) {
    auto chapter = process_chapter({page(1, {})}, 1, "chapter-0");
    EXPECT_EQ(chapter.title, "Chapter");
    ASSERT_EQ(chapter.sections.size(), 1u);
    EXPECT_EQ(chapter.sections[0].title, "Content");
    EXPECT_EQ(chapter.sections[0].start_page, 1);
    EXPECT_EQ(chapter.sections[0].end_page, 1);
    EXPECT_TRUE(chapter.sections[0].concepts.empty());
    EXPECT_EQ(chapter.estimated_tokens, 0);
}

TEST(TokenEstimatorTest, RoundsUpQuarterOfLength) {
    EXPECT_EQ(estimate_tokens(""), 0);
    EXPECT_EQ(estimate_tokens("a"), 1);
    EXPECT_EQ(estimate_tokens("abcd"), 1);
    EXPECT_EQ(estimate_tokens("abcde"), 2);
    EXPECT_EQ(estimate_tokens(std::string(400, 'z')), 100);
}

TEST(TokenEstimatorTest, CountsUtf16UnitsNotBytes) {
    EXPECT_EQ(estimate_tokens("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"), 1);      // 4 x U+00E9
    EXPECT_EQ(estimate_tokens("\xE6\xB0\xB4\xE6\xB0\xB4\xE6\xB0\xB4\xE6\xB0\xB4\xE6\xB0\xB4"), 2);  // 5 x U+6C34
    EXPECT_EQ(estimate_tokens("\xF0\x9F\x98\x80\xF0\x9F\x98\x80"), 1);      // 2 x U+1F600, surrogate pairs
    EXPECT_EQ(utf16_length("a\xC3\xA9\xF0\x9F\x98\x80"), 4u);
}
