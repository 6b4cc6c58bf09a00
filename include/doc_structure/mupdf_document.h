#pragma once

#include "doc_structure/providers.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace doc_structure {

// MuPDF-backed implementation of the three provider interfaces over an
// in-memory document. Each get_text_runs call works on a private MuPDF
// context, so page retrieval may run concurrently; the other calls are not
// thread-safe.
class MupdfDocument : public MetadataProvider,
                      public OutlineProvider,
                      public PageProvider {
public:
    explicit MupdfDocument(std::vector<uint8_t> bytes);
    ~MupdfDocument() override;

    MupdfDocument(const MupdfDocument&) = delete;
    MupdfDocument& operator=(const MupdfDocument&) = delete;

    DocumentMetadata get_metadata() const override;

    std::optional<std::vector<OutlineNode>> get_outline() const override;
    PageRef resolve_destination(const DestinationRef& dest) const override;
    int page_index_of(const PageRef& ref) const override;

    int page_count() const override;
    std::vector<TextRun> get_text_runs(int page_number) const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace doc_structure
