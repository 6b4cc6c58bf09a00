#include "doc_structure/outline.h"
#include <stack>

namespace doc_structure {

std::vector<TOCEntry> flatten_outline(const std::optional<std::vector<OutlineNode>>& outline,
                                      const OutlineProvider& resolver) {
    std::vector<TOCEntry> toc;
    if (!outline) {
        return toc;
    }

    // Explicit stack instead of recursion; bookmark trees come from the
    // document and may be arbitrarily deep. Siblings are pushed in reverse
    // so they pop in document order.
    std::stack<std::pair<const OutlineNode*, int>> pending;
    for (auto it = outline->rbegin(); it != outline->rend(); ++it) {
        pending.push({&*it, 0});
    }

    while (!pending.empty()) {
        auto [node, level] = pending.top();
        pending.pop();

        if (node->title && !node->title->empty()) {
            int page_index = 0;
            if (node->dest) {
                page_index = resolver.page_index_of(resolver.resolve_destination(*node->dest));
            }

            TOCEntry entry;
            entry.title = *node->title;
            entry.page_number = page_index + 1;
            entry.level = level;
            entry.id = "toc-" + std::to_string(toc.size());
            toc.push_back(std::move(entry));
        }

        for (auto it = node->items.rbegin(); it != node->items.rend(); ++it) {
            pending.push({&*it, level + 1});
        }
    }

    return toc;
}

} // namespace doc_structure
