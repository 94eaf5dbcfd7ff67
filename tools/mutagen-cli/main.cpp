#include <iostream>
#include <fstream>
#include <iterator>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include "mutagen/mutagen.hpp"
#include "mutagen/debug.hpp"

void print_usage(const char* program) {
    std::cout << "Mutagen v" << mutagen::Version::string() << "\n\n"
              << "Usage: " << program << " [options] <grammar-file>\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "  -r, --rule <name>    Rule to generate from (default: -root- or the first rule)\n"
              << "  -s, --seed <n>       First seed (default: 0)\n"
              << "  -n, --count <n>      Number of consecutive seeds (default: 5)\n"
              << "  --json               Output diagnostics and text as JSON lines\n"
              << "  --check              Check the grammar only, don't generate\n"
              << "  --dump               Print the compiled grammar as JSON\n"
              << "  --stats              Print compilation statistics\n"
              << std::endl;
}

void print_version() {
    std::cout << "mutagen " << mutagen::Version::string() << std::endl;
}

template<typename T>
bool parse_number(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string input_file;
    std::string rule;
    std::uint64_t first_seed = 0;
    std::uint32_t count = 5;
    bool json_output = false;
    bool check_only = false;
    bool dump = false;
    bool stats = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return EXIT_SUCCESS;
        }

        if (arg == "--json") {
            json_output = true;
            continue;
        }

        if (arg == "--check") {
            check_only = true;
            continue;
        }

        if (arg == "--dump") {
            dump = true;
            continue;
        }

        if (arg == "--stats") {
            stats = true;
            continue;
        }

        bool takes_value = arg == "-r" || arg == "--rule" ||
                           arg == "-s" || arg == "--seed" ||
                           arg == "-n" || arg == "--count";
        if (takes_value && i + 1 >= argc) {
            std::cerr << "error: missing value for " << arg << "\n";
            return EXIT_FAILURE;
        }

        if (arg == "-r" || arg == "--rule") {
            rule = argv[++i];
            continue;
        }

        if (arg == "-s" || arg == "--seed") {
            if (!parse_number(argv[++i], first_seed)) {
                std::cerr << "error: invalid seed '" << argv[i] << "'\n";
                return EXIT_FAILURE;
            }
            continue;
        }

        if (arg == "-n" || arg == "--count") {
            if (!parse_number(argv[++i], count)) {
                std::cerr << "error: invalid count '" << argv[i] << "'\n";
                return EXIT_FAILURE;
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "error: unknown option " << arg << "\n";
            return EXIT_FAILURE;
        }

        // Assume it's the input file
        if (input_file.empty()) {
            input_file = arg;
        } else {
            std::cerr << "error: multiple input files not supported\n";
            return EXIT_FAILURE;
        }
    }

    if (input_file.empty()) {
        std::cerr << "error: no input file specified\n";
        return EXIT_FAILURE;
    }

    // Compile
    auto result = mutagen::compile_grammar_file(input_file, rule);

    // Output diagnostics
    std::ifstream source_file(input_file);
    std::string source_content;
    if (source_file) {
        source_content.assign(
            std::istreambuf_iterator<char>(source_file),
            std::istreambuf_iterator<char>()
        );
    }

    for (const auto& diag : result.diagnostics) {
        if (json_output) {
            std::cout << mutagen::format_diagnostic_json(diag) << "\n";
        } else {
            std::cerr << mutagen::format_diagnostic(diag, source_content);
        }
    }

    if (!result.success) {
        return EXIT_FAILURE;
    }

    auto& generator = *result.generator;
    const auto& compiled = generator.grammar();

    if (stats) {
        if (json_output) {
            std::cout << "{\"rule\":\"" << mutagen::escape_json(result.rule) << "\""
                      << ",\"nodes\":" << compiled.nodes.size()
                      << ",\"cyclesUsed\":" << compiled.cycles_used
                      << ",\"labels\":" << compiled.label_count
                      << ",\"shuffleSlots\":" << compiled.shuffle_slots << "}\n";
        } else {
            std::cout << "Rule:          " << result.rule << "\n"
                      << "Nodes:         " << compiled.nodes.size() << "\n"
                      << "Cycles used:   " << compiled.cycles_used << "\n"
                      << "Labels:        " << compiled.label_count << "\n"
                      << "Shuffle slots: " << compiled.shuffle_slots << "\n";
        }
    }

    if (dump) {
        std::cout << mutagen::serialize_compiled_json(compiled) << "\n";
    }

    if (check_only) {
        return EXIT_SUCCESS;
    }

    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint64_t seed = first_seed + i;
        std::string text = generator.generate(seed);
        if (json_output) {
            std::cout << "{\"seed\":" << seed
                      << ",\"text\":\"" << mutagen::escape_json(text) << "\"}\n";
        } else {
            std::cout << text << "\n";
        }
    }

    return EXIT_SUCCESS;
}
