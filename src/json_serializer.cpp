#include "doc_structure/json_serializer.h"

namespace doc_structure {

nlohmann::json JsonSerializer::to_json(const TOCEntry& entry) {
    return {
        {"title", entry.title},
        {"pageNumber", entry.page_number},
        {"level", entry.level},
        {"id", entry.id}
    };
}

nlohmann::json JsonSerializer::to_json(const Section& section) {
    nlohmann::json result;
    result["id"] = section.id;
    result["title"] = section.title;
    result["content"] = section.content;

    result["subsections"] = nlohmann::json::array();
    for (const auto& subsection : section.subsections) {
        result["subsections"].push_back(to_json(subsection));
    }

    result["startPage"] = section.start_page;
    result["endPage"] = section.end_page;
    result["concepts"] = section.concepts;
    result["estimatedTokens"] = section.estimated_tokens;
    return result;
}

nlohmann::json JsonSerializer::to_json(const Chapter& chapter) {
    nlohmann::json result;
    result["id"] = chapter.id;
    result["title"] = chapter.title;

    result["sections"] = nlohmann::json::array();
    for (const auto& section : chapter.sections) {
        result["sections"].push_back(to_json(section));
    }

    result["startPage"] = chapter.start_page;
    result["endPage"] = chapter.end_page;
    result["estimatedTokens"] = chapter.estimated_tokens;
    return result;
}

nlohmann::json JsonSerializer::to_json(const DocumentStructure& structure) {
    nlohmann::json result;
    result["title"] = structure.title;
    if (structure.author) {
        result["author"] = *structure.author;
    }

    result["chapters"] = nlohmann::json::array();
    for (const auto& chapter : structure.chapters) {
        result["chapters"].push_back(to_json(chapter));
    }

    result["tableOfContents"] = nlohmann::json::array();
    for (const auto& entry : structure.table_of_contents) {
        result["tableOfContents"].push_back(to_json(entry));
    }

    result["totalPages"] = structure.total_pages;
    result["estimatedTokens"] = structure.estimated_tokens;
    return result;
}

std::string JsonSerializer::serialize(const DocumentStructure& structure, bool pretty) {
    // Invalid UTF-8 from a damaged text layer is replaced rather than thrown
    const auto handler = nlohmann::json::error_handler_t::replace;
    return pretty ? to_json(structure).dump(2, ' ', false, handler)
                  : to_json(structure).dump(-1, ' ', false, handler);
}

} // namespace doc_structure
