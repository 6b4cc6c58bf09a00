#include "doc_structure/concept_extractor.h"
#include <cstddef>
#include <iostream>
#include <regex>
#include <unordered_set>

namespace doc_structure {

namespace {

// Applied in this order; the first capture group is the candidate term.
// Repetitions are bounded: the libstdc++ matcher recurses once per repeated
// character, so an unbounded \w+ over a spaceless text layer overflows the
// stack. Terms longer than 64 word characters, or separated from the
// definition phrase by more than 16 whitespace characters, are not reported.
const std::vector<std::regex>& definition_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\b(\w{1,64})\s{1,16}is\s{1,16}defined\s{1,16}as)",
                   std::regex::ECMAScript | std::regex::icase),
        std::regex(R"(\b(\w{1,64})\s{1,16}refers\s{1,16}to)",
                   std::regex::ECMAScript | std::regex::icase),
        std::regex(R"(The\s{1,16}term\s{1,16}(\w{1,64})\b)",
                   std::regex::ECMAScript | std::regex::icase),
        std::regex(R"(\b(\w{1,64}):\s{1,16}[A-Z])", std::regex::ECMAScript),
    };
    return patterns;
}

const size_t MIN_CONCEPT_LENGTH = 4;

} // namespace

std::vector<std::string> extract_concepts(const std::string& text, size_t max_concepts) {
    std::vector<std::string> concepts;
    std::unordered_set<std::string> seen;

    try {
        for (const auto& pattern : definition_patterns()) {
            auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const auto& match = *it;
                if (!match[1].matched || match[1].length() < static_cast<std::ptrdiff_t>(MIN_CONCEPT_LENGTH)) {
                    continue;
                }
                std::string term = match[1].str();
                if (seen.insert(term).second) {
                    concepts.push_back(std::move(term));
                }
            }
        }
    } catch (const std::regex_error& e) {
        // std::regex gives up on pathological input (error_complexity,
        // error_stack); the section simply has no concepts
        std::cerr << "[extract_concepts] Skipping concept extraction: " << e.what() << std::endl;
        return {};
    }

    if (concepts.size() > max_concepts) {
        concepts.resize(max_concepts);
    }
    return concepts;
}

} // namespace doc_structure
