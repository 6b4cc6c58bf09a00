#include <doc_structure/json_serializer.h>
#include <doc_structure/structure_extractor.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace doc_structure;

struct CLIOptions {
    std::string input_file;
    std::string output_file;    // empty = stdout
    int thread_count = 1;
    int batch_size = 10;
    bool compact = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input FILE           Input PDF file path\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          Output JSON file path (default: stdout)\n";
    std::cout << "  --threads N                Threads used to read pages (default: 1)\n";
    std::cout << "  --batch-size N             Pages read per batch (default: 10)\n";
    std::cout << "  --compact                  Write JSON without indentation\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (no summary)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i textbook.pdf\n";
    std::cout << "  " << program_name << " -i textbook.pdf -o structure.json --threads 4\n";
}

void print_version() {
    std::cout << "doc-structure version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, and nlohmann/json\n";
}

int parse_positive(const char* value, const char* name) {
    int parsed = std::stoi(value);
    if (parsed <= 0) {
        throw std::invalid_argument(std::string(name) + " must be positive");
    }
    return parsed;
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"threads", required_argument, nullptr, 1001},
        {"batch-size", required_argument, nullptr, 1002},
        {"compact", no_argument, nullptr, 1003},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1004},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_file = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 1001:  // threads
                options.thread_count = parse_positive(optarg, "threads");
                break;
            case 1002:  // batch-size
                options.batch_size = parse_positive(optarg, "batch-size");
                break;
            case 1003:  // compact
                options.compact = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1004:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_file.empty()) {
        throw std::invalid_argument("Input file is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

void print_summary(std::ostream& out, const DocumentStructure& structure, long long elapsed_ms) {
    size_t section_count = 0;
    for (const auto& chapter : structure.chapters) {
        section_count += chapter.sections.size();
    }

    out << "\n=== Structure Extracted ===\n";
    out << "Title: " << structure.title << "\n";
    if (structure.author) {
        out << "Author: " << *structure.author << "\n";
    }
    out << "Pages: " << structure.total_pages << "\n";
    out << "TOC entries: " << structure.table_of_contents.size() << "\n";
    out << "Chapters: " << structure.chapters.size() << "\n";
    out << "Sections: " << section_count << "\n";
    out << "Estimated tokens: " << structure.estimated_tokens << "\n";
    out << "Processing time: " << elapsed_ms << "ms\n";
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        if (!fs::exists(options.input_file)) {
            throw std::runtime_error("Input file not found: " + options.input_file);
        }

        ExtractOptions extract_opts;
        extract_opts.thread_count = static_cast<size_t>(options.thread_count);
        extract_opts.batch_size = static_cast<size_t>(options.batch_size);
        extract_opts.verbose = options.verbose;

        // Keep stdout clean for the JSON when writing there
        const bool to_stdout = options.output_file.empty();
        std::ostream& report = to_stdout ? std::cerr : std::cout;

        if (options.verbose) {
            report << "Processing: " << options.input_file << "\n";
            extract_opts.progress = [&report](size_t current, size_t total) {
                report << "\rPages: " << current << "/" << total << std::flush;
                if (current == total) report << "\n";
            };
        }

        StructureExtractor extractor(extract_opts);

        auto start = std::chrono::high_resolution_clock::now();
        DocumentStructure structure = extractor.extract_file(options.input_file);
        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::string json = JsonSerializer::serialize(structure, !options.compact);

        if (to_stdout) {
            std::cout << json << "\n";
        } else {
            fs::path output_dir = fs::path(options.output_file).parent_path();
            if (!output_dir.empty() && !fs::exists(output_dir)) {
                fs::create_directories(output_dir);
            }

            std::ofstream out(options.output_file);
            if (!out) {
                throw std::runtime_error("Cannot write output file: " + options.output_file);
            }
            out << json << "\n";
        }

        if (!options.quiet) {
            print_summary(report, structure, elapsed.count());
            if (!to_stdout) {
                report << "Output saved to: " << options.output_file << "\n";
            }
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
