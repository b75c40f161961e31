#include "cli_options.hpp"
#include "sudoku_csp/observer.hpp"
#include <cstdlib>
#include <cstring>

namespace sudoku_csp {
namespace io {

namespace {

bool parse_count(const char* text, long& out) {
    char* end = nullptr;
    out = std::strtol(text, &end, 10);
    return end != text && *end == '\0' && out >= 0;
}

}  // namespace

CliOptions parse_options(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        long value = 0;
        if (std::strcmp(argv[i], "-a") == 0) {
            opts.print_all = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            opts.print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            // レベル省略時は 1
            if (i + 1 < argc && parse_count(argv[i + 1], value)) {
                opts.verbose_level = static_cast<int>(value);
                ++i;
            } else {
                opts.verbose_level = VerboseObserver::SUMMARY;
            }
        } else if (std::strcmp(argv[i], "-b") == 0) {
            opts.order = SearchOrder::BreadthFirst;
        } else if (std::strcmp(argv[i], "-n") == 0) {
            if (i + 1 >= argc) {
                throw UsageError("Missing value for -n");
            }
            if (!parse_count(argv[++i], value)) {
                throw UsageError(std::string("Invalid solution limit: ") + argv[i]);
            }
            opts.solution_limit = static_cast<size_t>(value);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            opts.show_help = true;
            return opts;
        } else if (argv[i][0] != '-') {
            opts.filename = argv[i];
        } else {
            throw UsageError(std::string("Unknown option: ") + argv[i]);
        }
    }

    if (opts.filename.empty()) {
        throw UsageError("No puzzle file given");
    }
    return opts;
}

} // namespace io
} // namespace sudoku_csp
