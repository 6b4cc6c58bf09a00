#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace doc_structure {

// Mines definition-style terms ("X is defined as", "X refers to",
// "The term X", "X: Y"). Terms of three characters or fewer are ignored.
// Never throws: a regex engine failure yields an empty list.
std::vector<std::string> extract_concepts(const std::string& text, size_t max_concepts = 10);

} // namespace doc_structure
