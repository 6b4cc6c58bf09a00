#pragma once

#include "doc_structure/document_types.h"
#include <string>
#include <nlohmann/json.hpp>

namespace doc_structure {

class JsonSerializer {
public:
    // camelCase field names; "author" is omitted when absent
    static nlohmann::json to_json(const DocumentStructure& structure);

    static nlohmann::json to_json(const Chapter& chapter);
    static nlohmann::json to_json(const Section& section);
    static nlohmann::json to_json(const TOCEntry& entry);

    static std::string serialize(const DocumentStructure& structure, bool pretty = true);
};

} // namespace doc_structure
