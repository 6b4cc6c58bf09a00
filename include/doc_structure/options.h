#pragma once

#include <cstddef>
#include <functional>

namespace doc_structure {

// Empirically tuned heading thresholds. Changing them changes the
// structural output of every document.
struct HeuristicOptions {
    float chapter_title_min_font_size = 14.0f;    // strictly greater than
    float section_heading_min_font_size = 12.0f;  // strictly greater than
    float pattern_size_tolerance = 1.0f;          // strictly less than
    size_t max_title_length = 100;                // code points
    size_t max_concepts = 10;
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;
using CancelCallback = std::function<bool()>;

struct ExtractOptions {
    size_t thread_count = 1;    // > 1 retrieves pages in parallel
    size_t batch_size = 10;     // pages per retrieval batch
    bool verbose = false;
    HeuristicOptions heuristics;
    ProgressCallback progress;
    CancelCallback should_cancel;
};

} // namespace doc_structure
