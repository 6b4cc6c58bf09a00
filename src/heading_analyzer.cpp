#include "doc_structure/heading_analyzer.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace doc_structure {

namespace {

float round_to_tenth(float size) {
    return std::round(size * 10.0f) / 10.0f;
}

} // namespace

HeadingPatterns identify_heading_patterns(const std::vector<Page>& pages) {
    // (size, font) -> occurrence count, scoped to this call
    std::map<std::pair<float, std::string>, size_t> font_stats;

    for (const auto& page : pages) {
        for (const auto& run : page.runs) {
            font_stats[{round_to_tenth(run.font_size), run.font_name}]++;
        }
    }

    std::vector<FontSignature> signatures;
    signatures.reserve(font_stats.size());
    for (const auto& [key, count] : font_stats) {
        signatures.push_back({key.first, key.second});
    }

    std::sort(signatures.begin(), signatures.end(),
              [](const FontSignature& a, const FontSignature& b) {
                  if (a.font_size != b.font_size) {
                      return a.font_size > b.font_size;
                  }
                  return a.font_name < b.font_name;
              });

    HeadingPatterns patterns;
    if (!signatures.empty()) {
        patterns.chapter_pattern = signatures[0];
    }
    if (signatures.size() > 1) {
        patterns.section_pattern = signatures[1];
    }
    return patterns;
}

} // namespace doc_structure
