#pragma once

#include "doc_structure/document_types.h"
#include "doc_structure/options.h"
#include "doc_structure/providers.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_structure {

// Combines metadata, chapters and the flattened TOC into the final structure.
DocumentStructure assemble_structure(const DocumentMetadata& metadata,
                                     std::vector<Chapter> chapters,
                                     std::vector<TOCEntry> toc,
                                     int total_pages);

// Builds chapters from ordered pages and a flattened TOC.
std::vector<Chapter> identify_structure(const std::vector<Page>& pages,
                                        const std::vector<TOCEntry>& toc,
                                        const HeuristicOptions& heuristics = HeuristicOptions{});

class StructureExtractor {
public:
    explicit StructureExtractor(const ExtractOptions& options = ExtractOptions{});
    ~StructureExtractor();

    // Opens the document with MuPDF
    DocumentStructure extract_structure(const std::vector<uint8_t>& document_bytes);

    DocumentStructure extract_structure(const MetadataProvider& metadata,
                                        const OutlineProvider& outline,
                                        const PageProvider& pages);

    DocumentStructure extract_file(const std::string& path);

    // documents_processed, pages_processed, total_processing_time_ms and
    // the derived averages once a document has been processed
    nlohmann::json get_stats() const;

    ExtractOptions get_options() const;
    void set_options(const ExtractOptions& options);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace doc_structure
