#pragma once

#include "doc_structure/document_types.h"
#include <optional>
#include <string>
#include <vector>

namespace doc_structure {

struct FontSignature {
    float font_size = 0.0f;     // rounded to one decimal
    std::string font_name;

    bool operator==(const FontSignature& other) const {
        return font_size == other.font_size && font_name == other.font_name;
    }
};

struct HeadingPatterns {
    std::optional<FontSignature> chapter_pattern;
    std::optional<FontSignature> section_pattern;
};

// Assumes the largest font denotes chapter headings and the next distinct
// (size, font) pair denotes section headings. Ties on size are broken by
// font name.
HeadingPatterns identify_heading_patterns(const std::vector<Page>& pages);

} // namespace doc_structure
