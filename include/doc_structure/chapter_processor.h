#pragma once

#include "doc_structure/document_types.h"
#include "doc_structure/options.h"
#include <string>
#include <vector>

namespace doc_structure {

// Section boundaries relative to a chapter's page slice.
struct RawSection {
    std::string title;
    std::string content;
    int start_page = 0;     // 0-based offset into the slice
    int end_page = 0;
};

// Never returns an empty sequence for a non-empty slice. A slice without
// any heading candidate becomes one section titled "Content".
std::vector<RawSection> split_into_sections(const std::vector<Page>& pages,
                                            const HeuristicOptions& heuristics = HeuristicOptions{});

// Large-font text of the slice's first page, or "Chapter".
std::string derive_chapter_title(const std::vector<Page>& pages,
                                 const HeuristicOptions& heuristics = HeuristicOptions{});

Chapter process_chapter(const std::vector<Page>& pages,
                        int start_page_number,
                        const std::string& chapter_id,
                        const HeuristicOptions& heuristics = HeuristicOptions{});

} // namespace doc_structure
