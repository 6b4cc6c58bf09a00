#include "doc_structure/mupdf_document.h"
#include "doc_structure/errors.h"
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
#include <string>
#include <utility>

namespace doc_structure {

namespace {

struct ContextDeleter {
    void operator()(fz_context* ctx) const { fz_drop_context(ctx); }
};

struct DocumentDeleter {
    fz_context* ctx;
    void operator()(fz_document* doc) const { fz_drop_document(ctx, doc); }
};

struct PageDeleter {
    fz_context* ctx;
    void operator()(fz_page* page) const { fz_drop_page(ctx, page); }
};

struct StextDeleter {
    fz_context* ctx;
    void operator()(fz_stext_page* stext) const { fz_drop_stext_page(ctx, stext); }
};

struct OutlineDeleter {
    fz_context* ctx;
    void operator()(fz_outline* outline) const { fz_drop_outline(ctx, outline); }
};

using ContextPtr = std::unique_ptr<fz_context, ContextDeleter>;
using DocumentPtr = std::unique_ptr<fz_document, DocumentDeleter>;

ContextPtr new_context() {
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_UNLIMITED);
    if (!ctx) {
        throw DocumentError("Failed to create MuPDF context");
    }
    return ContextPtr(ctx);
}

// The document keeps its own reference to the stream; `bytes` must outlive it.
DocumentPtr open_document(fz_context* ctx, const std::vector<uint8_t>& bytes) {
    fz_stream* stream = nullptr;
    fz_document* doc = nullptr;
    bool failed = false;
    std::string message;

    fz_var(stream);
    fz_var(doc);
    fz_var(failed);

    fz_try(ctx) {
        fz_register_document_handlers(ctx);
        stream = fz_open_memory(ctx, bytes.data(), bytes.size());
        doc = fz_open_document_with_stream(ctx, "application/pdf", stream);
    }
    fz_always(ctx) {
        fz_drop_stream(ctx, stream);
    }
    fz_catch(ctx) {
        failed = true;
        message = fz_caught_message(ctx);
    }

    if (failed || !doc) {
        throw DocumentError("Failed to open document: " + message);
    }
    return DocumentPtr(doc, DocumentDeleter{ctx});
}

void flush_run(fz_context* ctx, TextRun& run, fz_font* font, float size, const fz_rect& bbox,
               std::vector<TextRun>& runs) {
    if (run.text.empty()) {
        return;
    }
    const char* name = font ? fz_font_name(ctx, font) : nullptr;
    run.font_name = name && *name ? name : "unknown";
    run.font_size = size;
    run.width = bbox.x1 - bbox.x0;
    run.height = bbox.y1 - bbox.y0;
    runs.push_back(std::move(run));
    run = TextRun{};
}

// Consecutive characters of a line sharing font and size form one run.
std::vector<TextRun> stext_to_runs(fz_context* ctx, fz_stext_page* stext) {
    std::vector<TextRun> runs;

    for (fz_stext_block* block = stext->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) {
            continue;
        }

        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            TextRun run;
            fz_font* font = nullptr;
            float size = 0.0f;
            fz_rect bbox = {0, 0, 0, 0};
            bool open = false;

            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                if (open && (ch->font != font || ch->size != size)) {
                    flush_run(ctx, run, font, size, bbox, runs);
                    open = false;
                }

                fz_rect char_box = fz_rect_from_quad(ch->quad);
                if (!open) {
                    run.x = ch->origin.x;
                    run.y = ch->origin.y;
                    font = ch->font;
                    size = ch->size;
                    bbox = char_box;
                    open = true;
                } else {
                    bbox = fz_union_rect(bbox, char_box);
                }

                char utf8[5] = {0};
                int len = fz_runetochar(utf8, ch->c);
                run.text.append(utf8, len);
            }

            if (open) {
                flush_run(ctx, run, font, size, bbox, runs);
            }
        }
    }

    return runs;
}

std::string trim_whitespace(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

// MuPDF may or may not keep the namespace prefix in tag names
bool has_local_name(const char* tag, const std::string& name) {
    std::string full(tag);
    size_t colon = full.rfind(':');
    return (colon == std::string::npos ? full : full.substr(colon + 1)) == name;
}

// First non-blank text node below `element`
std::optional<std::string> first_text_below(fz_xml* element) {
    std::vector<fz_xml*> pending;
    if (fz_xml* child = fz_xml_down(element)) {
        pending.push_back(child);
    }

    while (!pending.empty()) {
        fz_xml* node = pending.back();
        pending.pop_back();

        if (!fz_xml_tag(node)) {
            const char* text = fz_xml_text(node);
            std::string value = text ? trim_whitespace(text) : "";
            if (!value.empty()) {
                return value;
            }
        }
        if (fz_xml* next = fz_xml_next(node)) pending.push_back(next);
        if (fz_xml* down = fz_xml_down(node)) pending.push_back(down);
    }
    return std::nullopt;
}

// XMP values sit in e.g. dc:title/rdf:Alt/rdf:li or dc:creator/rdf:Seq/rdf:li
std::optional<std::string> find_xmp_value(fz_xml* root, const std::string& name) {
    std::vector<fz_xml*> pending;
    if (root) {
        pending.push_back(root);
    }

    while (!pending.empty()) {
        fz_xml* node = pending.back();
        pending.pop_back();

        const char* tag = fz_xml_tag(node);
        if (tag && has_local_name(tag, name)) {
            if (auto value = first_text_below(node)) {
                return value;
            }
        }
        if (fz_xml* next = fz_xml_next(node)) pending.push_back(next);
        if (fz_xml* down = fz_xml_down(node)) pending.push_back(down);
    }
    return std::nullopt;
}

} // namespace

class MupdfDocument::Impl {
public:
    explicit Impl(std::vector<uint8_t> bytes)
        : bytes_(std::move(bytes)),
          ctx_(new_context()),
          doc_(open_document(ctx_.get(), bytes_)) {}

    ~Impl() {
        // Document must go before its context
        doc_.reset();
    }

    std::optional<std::string> lookup_metadata(const char* key) const {
        fz_context* ctx = ctx_.get();
        std::vector<char> buffer(256);
        int needed = -1;
        bool failed = false;
        std::string message;

        fz_var(needed);
        fz_var(failed);

        for (int attempt = 0; attempt < 2; ++attempt) {
            char* data = buffer.data();
            size_t size = buffer.size();
            fz_try(ctx) {
                needed = fz_lookup_metadata(ctx, doc_.get(), key, data, size);
            }
            fz_catch(ctx) {
                failed = true;
                message = fz_caught_message(ctx);
            }

            if (failed) {
                throw DocumentError(std::string("Failed to read metadata ") + key + ": " + message);
            }
            if (needed <= 0) {
                return std::nullopt;
            }
            if (static_cast<size_t>(needed) <= buffer.size()) {
                break;
            }
            buffer.resize(static_cast<size_t>(needed));
        }

        std::string value(buffer.data());
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }

    // Reads the catalog's XMP packet. A missing or unreadable packet only
    // means there is no fallback value.
    std::optional<std::string> lookup_xmp(const std::string& name) const {
        fz_context* ctx = ctx_.get();
        pdf_document* pdf = pdf_specifics(ctx, doc_.get());
        if (!pdf) {
            return std::nullopt;
        }

        fz_buffer* buffer = nullptr;
        decltype(fz_parse_xml(ctx, buffer, 0)) xml = nullptr;

        fz_var(buffer);
        fz_var(xml);

        fz_try(ctx) {
            pdf_obj* metadata = pdf_dict_getp(ctx, pdf_trailer(ctx, pdf), "Root/Metadata");
            if (pdf_is_stream(ctx, metadata)) {
                buffer = pdf_load_stream(ctx, metadata);
                xml = fz_parse_xml(ctx, buffer, 0);
            }
        }
        fz_always(ctx) {
            fz_drop_buffer(ctx, buffer);
        }
        fz_catch(ctx) {
            fz_warn(ctx, "ignoring unreadable XMP metadata: %s", fz_caught_message(ctx));
            return std::nullopt;
        }

        if (!xml) {
            return std::nullopt;
        }
        auto value = find_xmp_value(fz_xml_root(xml), name);
        fz_drop_xml(ctx, xml);
        return value;
    }

    std::optional<std::vector<OutlineNode>> load_outline() const {
        fz_context* ctx = ctx_.get();
        fz_outline* raw = nullptr;
        bool failed = false;
        std::string message;

        fz_var(raw);
        fz_var(failed);

        fz_try(ctx) {
            raw = fz_load_outline(ctx, doc_.get());
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            throw DocumentError("Failed to load outline: " + message);
        }
        if (!raw) {
            return std::nullopt;
        }

        std::unique_ptr<fz_outline, OutlineDeleter> outline(raw, OutlineDeleter{ctx});
        return convert_outline(outline.get());
    }

    PageRef resolve(const DestinationRef& dest) const {
        fz_context* ctx = ctx_.get();
        fz_location location = fz_make_location(-1, -1);
        bool failed = false;
        std::string message;

        fz_var(location);
        fz_var(failed);

        fz_try(ctx) {
            float x = 0, y = 0;
            location = fz_resolve_link(ctx, doc_.get(), dest.c_str(), &x, &y);
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            throw DocumentError("Failed to resolve destination " + dest + ": " + message);
        }
        if (location.page < 0) {
            return PageRef{};
        }
        return PageRef{location.chapter, location.page};
    }

    int page_index(const PageRef& ref) const {
        fz_context* ctx = ctx_.get();
        int index = 0;
        bool failed = false;
        std::string message;

        fz_var(index);
        fz_var(failed);

        fz_try(ctx) {
            index = fz_page_number_from_location(ctx, doc_.get(), fz_make_location(ref.chapter, ref.page));
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            throw DocumentError("Failed to locate page: " + message);
        }
        return index;
    }

    int count_pages() const {
        fz_context* ctx = ctx_.get();
        int count = 0;
        bool failed = false;
        std::string message;

        fz_var(count);
        fz_var(failed);

        fz_try(ctx) {
            count = fz_count_pages(ctx, doc_.get());
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            throw DocumentError("Failed to count pages: " + message);
        }
        return count;
    }

    // Works on a private context and document so callers may run it from
    // several threads at once.
    std::vector<TextRun> extract_runs(int page_number) const {
        ContextPtr owned_ctx = new_context();
        fz_context* ctx = owned_ctx.get();
        DocumentPtr doc = open_document(ctx, bytes_);

        fz_page* page = nullptr;
        fz_stext_page* stext = nullptr;
        bool failed = false;
        std::string message;

        fz_var(page);
        fz_var(stext);
        fz_var(failed);

        fz_try(ctx) {
            int count = fz_count_pages(ctx, doc.get());
            if (page_number < 1 || page_number > count) {
                fz_throw(ctx, FZ_ERROR_GENERIC, "page %d out of range", page_number);
            }
            page = fz_load_page(ctx, doc.get(), page_number - 1);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
            stext = fz_new_stext_page_from_page(ctx, page, &opts);
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        std::unique_ptr<fz_page, PageDeleter> page_guard(page, PageDeleter{ctx});
        std::unique_ptr<fz_stext_page, StextDeleter> stext_guard(stext, StextDeleter{ctx});

        if (failed) {
            throw DocumentError("Failed to extract page " + std::to_string(page_number) + ": " + message);
        }

        auto runs = stext_to_runs(ctx, stext_guard.get());

        // Guards drop page data before the document and context
        stext_guard.reset();
        page_guard.reset();
        doc.reset();
        return runs;
    }

private:
    OutlineNode to_node(fz_outline* item) const {
        OutlineNode node;
        if (item->title) {
            node.title = std::string(item->title);
        }
        if (item->uri && !fz_is_external_link(ctx_.get(), item->uri)) {
            node.dest = std::string(item->uri);
        }
        return node;
    }

    // Iterative walk over the down/next links. A sibling list is filled
    // completely before its children are queued, so the queued vector
    // pointers stay valid.
    std::vector<OutlineNode> convert_outline(fz_outline* root) const {
        std::vector<OutlineNode> top;
        std::vector<std::pair<fz_outline*, std::vector<OutlineNode>*>> pending = {{root, &top}};

        while (!pending.empty()) {
            auto [first, target] = pending.back();
            pending.pop_back();

            for (fz_outline* item = first; item; item = item->next) {
                target->push_back(to_node(item));
            }

            size_t index = 0;
            for (fz_outline* item = first; item; item = item->next, ++index) {
                if (item->down) {
                    pending.push_back({item->down, &(*target)[index].items});
                }
            }
        }

        return top;
    }

    std::vector<uint8_t> bytes_;
    ContextPtr ctx_;
    DocumentPtr doc_;
};

MupdfDocument::MupdfDocument(std::vector<uint8_t> bytes)
    : pImpl(std::make_unique<Impl>(std::move(bytes))) {}

MupdfDocument::~MupdfDocument() = default;

DocumentMetadata MupdfDocument::get_metadata() const {
    DocumentMetadata metadata;
    metadata.title = pImpl->lookup_metadata(FZ_META_INFO_TITLE);
    metadata.author = pImpl->lookup_metadata(FZ_META_INFO_AUTHOR);

    // Info dictionary first, XMP packet second
    if (!metadata.title) {
        metadata.title = pImpl->lookup_xmp("title");
    }
    if (!metadata.author) {
        metadata.author = pImpl->lookup_xmp("creator");
    }
    return metadata;
}

std::optional<std::vector<OutlineNode>> MupdfDocument::get_outline() const {
    return pImpl->load_outline();
}

PageRef MupdfDocument::resolve_destination(const DestinationRef& dest) const {
    return pImpl->resolve(dest);
}

int MupdfDocument::page_index_of(const PageRef& ref) const {
    return pImpl->page_index(ref);
}

int MupdfDocument::page_count() const {
    return pImpl->count_pages();
}

std::vector<TextRun> MupdfDocument::get_text_runs(int page_number) const {
    return pImpl->extract_runs(page_number);
}

} // namespace doc_structure
