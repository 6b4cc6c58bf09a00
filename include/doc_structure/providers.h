#pragma once

#include "doc_structure/document_types.h"
#include <optional>
#include <string>
#include <vector>

namespace doc_structure {

struct DocumentMetadata {
    std::optional<std::string> title;
    std::optional<std::string> author;
};

// Opaque bookmark destination, resolved through the OutlineProvider that
// produced it.
using DestinationRef = std::string;

struct PageRef {
    int chapter = 0;
    int page = 0;
};

struct OutlineNode {
    std::optional<std::string> title;
    std::optional<DestinationRef> dest;
    std::vector<OutlineNode> items;
};

class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    virtual DocumentMetadata get_metadata() const = 0;
};

class OutlineProvider {
public:
    virtual ~OutlineProvider() = default;

    // std::nullopt when the document carries no outline at all
    virtual std::optional<std::vector<OutlineNode>> get_outline() const = 0;
    virtual PageRef resolve_destination(const DestinationRef& dest) const = 0;
    // Zero-based page index
    virtual int page_index_of(const PageRef& ref) const = 0;
};

// get_text_runs may be called from several threads at once when the
// extractor is configured with more than one thread.
class PageProvider {
public:
    virtual ~PageProvider() = default;

    virtual int page_count() const = 0;
    // page_number is 1-based
    virtual std::vector<TextRun> get_text_runs(int page_number) const = 0;
};

} // namespace doc_structure
