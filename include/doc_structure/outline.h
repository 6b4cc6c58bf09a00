#pragma once

#include "doc_structure/document_types.h"
#include "doc_structure/providers.h"
#include <optional>
#include <vector>

namespace doc_structure {

// Flattens a bookmark tree into table-of-contents entries in document
// (pre-)order. Untitled nodes emit nothing but their children still count
// one level deeper. Destinations are resolved through `resolver`; a node
// without a destination points at page 1.
std::vector<TOCEntry> flatten_outline(const std::optional<std::vector<OutlineNode>>& outline,
                                      const OutlineProvider& resolver);

} // namespace doc_structure
