#include "doc_structure/chapter_detector.h"
#include <algorithm>
#include <cmath>
#include <cctype>
#include <string>

namespace doc_structure {

namespace {

bool starts_with_ignore_case(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// "Chapter 3", "SECTION 12", "part 1": keyword, whitespace, digit
bool has_chapter_keyword(const std::string& text) {
    static const char* const keywords[] = {"chapter", "section", "part"};

    for (const char* keyword : keywords) {
        const std::string word(keyword);
        if (!starts_with_ignore_case(text, word)) {
            continue;
        }
        size_t i = word.size();
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i > word.size() && i < text.size() &&
            std::isdigit(static_cast<unsigned char>(text[i]))) {
            return true;
        }
    }
    return false;
}

bool is_chapter_heading(const TextRun& run, const FontSignature& signature,
                        const HeuristicOptions& heuristics) {
    return std::fabs(run.font_size - signature.font_size) < heuristics.pattern_size_tolerance &&
           run.font_name == signature.font_name &&
           has_chapter_keyword(run.text);
}

} // namespace

std::vector<int> find_chapter_boundaries(const std::vector<Page>& pages,
                                         const std::vector<TOCEntry>& toc,
                                         const HeadingPatterns& patterns,
                                         const HeuristicOptions& heuristics) {
    const int page_count = static_cast<int>(pages.size());
    if (page_count == 0) {
        return {};
    }

    std::vector<int> boundaries = {0};

    const bool has_top_level_entries = std::any_of(toc.begin(), toc.end(),
        [](const TOCEntry& entry) { return entry.level == 0; });

    if (has_top_level_entries) {
        for (const auto& entry : toc) {
            if (entry.level == 0) {
                boundaries.push_back(entry.page_number - 1);
            }
        }
    } else if (patterns.chapter_pattern) {
        const FontSignature& signature = *patterns.chapter_pattern;
        for (int i = 1; i < page_count; ++i) {
            const auto& runs = pages[i].runs;
            bool has_heading = std::any_of(runs.begin(), runs.end(),
                [&](const TextRun& run) { return is_chapter_heading(run, signature, heuristics); });
            if (has_heading) {
                boundaries.push_back(i);
            }
        }
    }

    // Outline destinations may point outside the document
    boundaries.erase(std::remove_if(boundaries.begin(), boundaries.end(),
                                    [page_count](int b) { return b < 0 || b >= page_count; }),
                     boundaries.end());

    std::sort(boundaries.begin(), boundaries.end());
    boundaries.erase(std::unique(boundaries.begin(), boundaries.end()), boundaries.end());
    return boundaries;
}

} // namespace doc_structure
