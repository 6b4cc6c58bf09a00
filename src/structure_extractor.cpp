#include "doc_structure/structure_extractor.h"
#include "doc_structure/chapter_detector.h"
#include "doc_structure/chapter_processor.h"
#include "doc_structure/errors.h"
#include "doc_structure/heading_analyzer.h"
#include "doc_structure/mupdf_document.h"
#include "doc_structure/outline.h"
#include "doc_structure/thread_pool.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>

namespace doc_structure {

namespace {

Page make_page(int page_number, std::vector<TextRun> runs) {
    Page page;
    page.page_number = page_number;
    for (auto& run : runs) {
        if (run.font_name.empty()) {
            run.font_name = "unknown";
        }
        if (!page.text.empty()) page.text += " ";
        page.text += run.text;
    }
    page.runs = std::move(runs);
    return page;
}

} // namespace

DocumentStructure assemble_structure(const DocumentMetadata& metadata,
                                     std::vector<Chapter> chapters,
                                     std::vector<TOCEntry> toc,
                                     int total_pages) {
    DocumentStructure structure;
    structure.title = metadata.title && !metadata.title->empty() ? *metadata.title : "Untitled Document";
    if (metadata.author && !metadata.author->empty()) {
        structure.author = metadata.author;
    }
    for (const auto& chapter : chapters) {
        structure.estimated_tokens += chapter.estimated_tokens;
    }
    structure.chapters = std::move(chapters);
    structure.table_of_contents = std::move(toc);
    structure.total_pages = total_pages;
    return structure;
}

std::vector<Chapter> identify_structure(const std::vector<Page>& pages,
                                        const std::vector<TOCEntry>& toc,
                                        const HeuristicOptions& heuristics) {
    std::vector<Chapter> chapters;

    auto patterns = identify_heading_patterns(pages);
    auto boundaries = find_chapter_boundaries(pages, toc, patterns, heuristics);

    for (size_t i = 0; i < boundaries.size(); ++i) {
        const int start = boundaries[i];
        const int end = i + 1 < boundaries.size() ? boundaries[i + 1] - 1
                                                  : static_cast<int>(pages.size()) - 1;

        std::vector<Page> chapter_pages(pages.begin() + start, pages.begin() + end + 1);
        chapters.push_back(process_chapter(chapter_pages, start + 1,
                                           "chapter-" + std::to_string(i), heuristics));
    }

    return chapters;
}

class StructureExtractor::Impl {
public:
    explicit Impl(const ExtractOptions& options) : options_(options) {
        stats_["documents_processed"] = 0;
        stats_["pages_processed"] = 0;
        stats_["total_processing_time_ms"] = 0;
    }

    DocumentStructure extract(const MetadataProvider& metadata_provider,
                              const OutlineProvider& outline_provider,
                              const PageProvider& page_provider) {
        auto start_time = std::chrono::high_resolution_clock::now();

        auto metadata = metadata_provider.get_metadata();
        auto toc = flatten_outline(outline_provider.get_outline(), outline_provider);
        log("extract", "Outline has " + std::to_string(toc.size()) + " entries");

        auto pages = retrieve_pages(page_provider);
        log("extract", "Retrieved " + std::to_string(pages.size()) + " pages");

        auto chapters = identify_structure(pages, toc, options_.heuristics);
        log("extract", "Identified " + std::to_string(chapters.size()) + " chapters");

        const int total_pages = static_cast<int>(pages.size());
        auto structure = assemble_structure(metadata, std::move(chapters), std::move(toc), total_pages);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        record_run(total_pages, duration.count());

        return structure;
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        nlohmann::json stats = stats_;

        if (stats["documents_processed"].get<int64_t>() > 0) {
            double total_ms = stats["total_processing_time_ms"].get<double>();
            stats["average_processing_time_ms"] =
                total_ms / stats["documents_processed"].get<double>();
            if (total_ms > 0) {
                stats["pages_per_second"] =
                    stats["pages_processed"].get<double>() / (total_ms / 1000.0);
            }
        }

        return stats;
    }

    ExtractOptions options_;

private:
    std::vector<Page> retrieve_pages(const PageProvider& provider) {
        const int page_count = std::max(0, provider.page_count());
        const size_t total = static_cast<size_t>(page_count);
        const size_t threads = std::max<size_t>(1, options_.thread_count);
        const size_t batch_size = std::max<size_t>(1, options_.batch_size);

        std::vector<Page> pages;
        pages.reserve(total);

        if (threads == 1) {
            for (int n = 1; n <= page_count; ++n) {
                check_cancelled();
                pages.push_back(make_page(n, provider.get_text_runs(n)));
                report_progress(pages.size(), total);
            }
            return pages;
        }

        ThreadPool pool(threads);
        log("retrieve_pages", "Retrieving " + std::to_string(page_count) + " pages on " +
                              std::to_string(pool.size()) + " threads");
        for (size_t first = 0; first < total; first += batch_size) {
            check_cancelled();
            const size_t batch_end = std::min(first + batch_size, total);

            std::vector<std::future<std::vector<TextRun>>> futures;
            futures.reserve(batch_end - first);
            for (size_t index = first; index < batch_end; ++index) {
                const int page_number = static_cast<int>(index) + 1;
                futures.push_back(pool.enqueue([&provider, page_number]() {
                    return provider.get_text_runs(page_number);
                }));
            }

            // Reassemble in page order; get() rethrows provider failures
            for (size_t k = 0; k < futures.size(); ++k) {
                pages.push_back(make_page(static_cast<int>(first + k) + 1, futures[k].get()));
                report_progress(pages.size(), total);
            }
        }

        return pages;
    }

    void check_cancelled() const {
        if (options_.should_cancel && options_.should_cancel()) {
            log("retrieve_pages", "Cancelled");
            throw ExtractionCancelled();
        }
    }

    void report_progress(size_t current, size_t total) const {
        if (options_.progress) {
            options_.progress(current, total);
        }
    }

    void record_run(int pages, int64_t elapsed_ms) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_["documents_processed"] = stats_["documents_processed"].get<int64_t>() + 1;
        stats_["pages_processed"] = stats_["pages_processed"].get<int64_t>() + pages;
        stats_["total_processing_time_ms"] = stats_["total_processing_time_ms"].get<int64_t>() + elapsed_ms;
    }

    void log(const char* method, const std::string& message) const {
        if (options_.verbose) {
            std::clog << "[StructureExtractor::" << method << "] " << message << std::endl;
        }
    }

    nlohmann::json stats_;
    mutable std::mutex stats_mutex_;
};

StructureExtractor::StructureExtractor(const ExtractOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

StructureExtractor::~StructureExtractor() = default;

DocumentStructure StructureExtractor::extract_structure(const std::vector<uint8_t>& document_bytes) {
    MupdfDocument document(document_bytes);
    return pImpl->extract(document, document, document);
}

DocumentStructure StructureExtractor::extract_structure(const MetadataProvider& metadata,
                                                        const OutlineProvider& outline,
                                                        const PageProvider& pages) {
    return pImpl->extract(metadata, outline, pages);
}

DocumentStructure StructureExtractor::extract_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Document not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open document: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());

    return extract_structure(bytes);
}

nlohmann::json StructureExtractor::get_stats() const {
    return pImpl->get_stats();
}

ExtractOptions StructureExtractor::get_options() const {
    return pImpl->options_;
}

void StructureExtractor::set_options(const ExtractOptions& options) {
    pImpl->options_ = options;
}

} // namespace doc_structure
