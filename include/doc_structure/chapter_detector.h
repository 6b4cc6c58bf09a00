#pragma once

#include "doc_structure/document_types.h"
#include "doc_structure/heading_analyzer.h"
#include "doc_structure/options.h"
#include <vector>

namespace doc_structure {

// Returns ascending, duplicate-free zero-based page indices at which a
// chapter starts. The first element is always 0 for a non-empty document;
// an empty document yields no boundaries.
//
// Top-level TOC entries win; otherwise pages carrying a
// "Chapter|Section|Part <n>" run in the chapter heading signature start a
// chapter. Indices past the last page are dropped.
std::vector<int> find_chapter_boundaries(const std::vector<Page>& pages,
                                         const std::vector<TOCEntry>& toc,
                                         const HeadingPatterns& patterns,
                                         const HeuristicOptions& heuristics = HeuristicOptions{});

} // namespace doc_structure
