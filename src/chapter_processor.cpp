#include "doc_structure/chapter_processor.h"
#include "doc_structure/concept_extractor.h"
#include "doc_structure/token_estimator.h"
#include <algorithm>
#include <cctype>

namespace doc_structure {

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

// Keeps at most max_chars UTF-8 code points
std::string truncate_utf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        bool is_lead = (static_cast<unsigned char>(s[i]) & 0xC0) != 0x80;
        if (is_lead) {
            if (chars == max_chars) {
                return s.substr(0, i);
            }
            chars++;
        }
    }
    return s;
}

// "2.1 ..." style numbering: digits, a dot, a digit
bool starts_with_decimal_number(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    return i > 0 && i + 1 < text.size() && text[i] == '.' &&
           std::isdigit(static_cast<unsigned char>(text[i + 1]));
}

// An uppercase letter followed by one or more uppercase letters or spaces
bool is_upper_ascii(char c) {
    return c >= 'A' && c <= 'Z';
}

bool is_all_caps_line(const std::string& text) {
    if (text.size() < 2 || !is_upper_ascii(text[0])) {
        return false;
    }
    return std::all_of(text.begin() + 1, text.end(), [](char c) {
        return is_upper_ascii(c) || std::isspace(static_cast<unsigned char>(c));
    });
}

// Plain scans rather than std::regex: run text has no length bound and the
// libstdc++ matcher recurses per repeated character.
const TextRun* find_heading_candidate(const Page& page, const HeuristicOptions& heuristics) {
    auto it = std::find_if(page.runs.begin(), page.runs.end(), [&](const TextRun& run) {
        return run.font_size > heuristics.section_heading_min_font_size &&
               (starts_with_decimal_number(run.text) || is_all_caps_line(run.text));
    });
    return it != page.runs.end() ? &*it : nullptr;
}

std::string join_page_texts(const std::vector<Page>& pages) {
    std::string content;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) content += "\n";
        content += pages[i].text;
    }
    return content;
}

} // namespace

std::vector<RawSection> split_into_sections(const std::vector<Page>& pages,
                                            const HeuristicOptions& heuristics) {
    std::vector<RawSection> sections;
    RawSection current;
    bool heading_seen = false;

    for (size_t i = 0; i < pages.size(); ++i) {
        const Page& page = pages[i];
        const int offset = static_cast<int>(i);
        const TextRun* heading = find_heading_candidate(page, heuristics);
        heading_seen = heading_seen || heading != nullptr;

        if (heading && !current.content.empty()) {
            sections.push_back(std::move(current));
            current = RawSection{heading->text, page.text, offset, offset};
        } else {
            current.content += "\n" + page.text;
            current.end_page = offset;
        }
    }

    if (!current.content.empty()) {
        sections.push_back(std::move(current));
    }

    // Also covers the empty slice
    if (!heading_seen || sections.empty()) {
        RawSection whole;
        whole.title = "Content";
        whole.content = join_page_texts(pages);
        whole.start_page = 0;
        whole.end_page = pages.empty() ? 0 : static_cast<int>(pages.size()) - 1;
        return {whole};
    }

    return sections;
}

std::string derive_chapter_title(const std::vector<Page>& pages,
                                 const HeuristicOptions& heuristics) {
    if (pages.empty()) {
        return "Chapter";
    }

    std::string candidate;
    for (const auto& run : pages.front().runs) {
        if (run.font_size > heuristics.chapter_title_min_font_size) {
            if (!candidate.empty()) candidate += " ";
            candidate += run.text;
        }
    }

    candidate = trim(candidate);
    if (candidate.empty()) {
        return "Chapter";
    }
    return truncate_utf8(candidate, heuristics.max_title_length);
}

Chapter process_chapter(const std::vector<Page>& pages,
                        int start_page_number,
                        const std::string& chapter_id,
                        const HeuristicOptions& heuristics) {
    Chapter chapter;
    chapter.id = chapter_id;
    chapter.title = derive_chapter_title(pages, heuristics);
    chapter.start_page = start_page_number;
    chapter.end_page = start_page_number + static_cast<int>(pages.size()) - 1;

    auto raw_sections = split_into_sections(pages, heuristics);
    chapter.sections.reserve(raw_sections.size());

    for (size_t i = 0; i < raw_sections.size(); ++i) {
        auto& raw = raw_sections[i];

        Section section;
        section.id = chapter_id + "-section-" + std::to_string(i);
        section.title = raw.title.empty() ? "Section " + std::to_string(i + 1) : raw.title;
        section.start_page = start_page_number + raw.start_page;
        section.end_page = start_page_number + raw.end_page;
        section.concepts = extract_concepts(raw.content, heuristics.max_concepts);
        section.estimated_tokens = estimate_tokens(raw.content);
        section.content = std::move(raw.content);

        chapter.estimated_tokens += section.estimated_tokens;
        chapter.sections.push_back(std::move(section));
    }

    return chapter;
}

} // namespace doc_structure
