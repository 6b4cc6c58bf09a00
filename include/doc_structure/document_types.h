#pragma once

#include <optional>
#include <string>
#include <vector>

namespace doc_structure {

// One glyph run as reported by the page provider.
// Coordinates are in the provider's page space; font_size is the scale
// magnitude of the text-rendering transform.
struct TextRun {
    std::string text;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float font_size = 0.0f;
    std::string font_name;
};

struct Page {
    int page_number = 1;        // 1-based
    std::string text;           // run texts joined by single spaces
    std::vector<TextRun> runs;
};

struct TOCEntry {
    std::string title;
    int page_number = 1;        // 1-based
    int level = 0;              // 0 = top-level chapter entry
    std::string id;
};

struct Section {
    std::string id;
    std::string title;
    std::string content;
    std::vector<Section> subsections;  // single-level sections, always empty
    int start_page = 1;
    int end_page = 1;
    std::vector<std::string> concepts;
    int estimated_tokens = 0;
};

struct Chapter {
    std::string id;
    std::string title;
    std::vector<Section> sections;
    int start_page = 1;
    int end_page = 1;
    int estimated_tokens = 0;
};

struct DocumentStructure {
    std::string title;
    std::optional<std::string> author;
    std::vector<Chapter> chapters;
    std::vector<TOCEntry> table_of_contents;
    int total_pages = 0;
    int estimated_tokens = 0;
};

} // namespace doc_structure
