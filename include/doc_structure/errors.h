#pragma once

#include <stdexcept>
#include <string>

namespace doc_structure {

// Raised by the MuPDF adapter when a document cannot be opened or read.
class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised when ExtractOptions::should_cancel asks the run to stop.
class ExtractionCancelled : public std::runtime_error {
public:
    ExtractionCancelled() : std::runtime_error("Structure extraction cancelled") {}
};

} // namespace doc_structure
