#include "obseq/script/program.hpp"
#include "obseq/script/runner.hpp"
#include <cstring>
#include <exception>
#include <iostream>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] [-s] [-p] <file.obs>\n";
    std::cerr << "  -v      Verbose mode (print window growth and cut search progress)\n";
    std::cerr << "  -s      Print engine statistics to stderr\n";
    std::cerr << "  -p      Prune DP scans with the cost model's monotonicity\n";
}

void print_stats(const obseq::Obseq* engine) {
    if (!engine) return;
    const auto& s = engine->stats();
    std::cerr << "% Stats: solves=" << s.solve_count
              << " expand_head=" << s.expand_head_count
              << " expand_tail=" << s.expand_tail_count
              << " contract_head=" << s.contract_head_count
              << " contract_tail=" << s.contract_tail_count
              << " candidates=" << s.candidate_count
              << " early_exits=" << s.early_exit_count
              << " scans=" << s.scan_count
              << "\n";
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool show_stats = false;
    bool pruning = false;
    const char* filename = nullptr;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            show_stats = true;
        } else if (std::strcmp(argv[i], "-p") == 0) {
            pruning = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    obseq::script::Runner runner(std::cout);
    runner.set_verbose(verbose);
    runner.set_expand_pruning(pruning);

    try {
        auto program = obseq::script::parse_file(filename);
        runner.run(*program);
    } catch (const std::exception& e) {
        if (show_stats) print_stats(runner.engine());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (show_stats) print_stats(runner.engine());
    return 0;
}
