#define ANKERL_NANOBENCH_IMPLEMENT
#include "benchmark.hpp"
#include <iostream>
#include <fstream>
#include <string>

std::ofstream g_output;

extern void bench_map_micro();
extern void bench_table_micro();
extern void bench_macro_insert();
extern void bench_macro_lookup();
extern void bench_macro_versions();
extern void bench_macro_diff();
extern void bench_macro_set_operations();

int main(int argc, char* argv[]) {
    std::string output_file = "benchmark_results.json";
    bool run_micro = true;
    bool run_macro = true;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--output" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (std::string(argv[i]) == "--micro-only") {
            run_macro = false;
        } else if (std::string(argv[i]) == "--macro-only") {
            run_micro = false;
        }
    }

    g_output.open(output_file);
    if (!g_output) {
        std::cerr << "Cannot open " << output_file << " for writing\n";
        return 1;
    }
    g_output << "[\n";

    std::cout << "mapkit Benchmark Suite\n";
    std::cout << "======================\n\n";

    if (run_micro) {
        std::cout << "Running microbenchmarks (nanobench)...\n";
        std::cout << "\n[PersistentMap vs std::map]\n";
        bench_map_micro();

        std::cout << "\n[HashTable vs std::unordered_map]\n";
        bench_table_micro();
    }

    if (run_macro) {
        std::cout << "\nRunning macrobenchmarks (comparison)...\n";
        std::cout << "\n[Bulk Insert]\n";
        bench_macro_insert();

        std::cout << "\n[Lookup]\n";
        bench_macro_lookup();

        std::cout << "\n[Keeping Old Versions]\n";
        bench_macro_versions();

        std::cout << "\n[Diff of Related Versions]\n";
        bench_macro_diff();

        std::cout << "\n[Set Operations]\n";
        bench_macro_set_operations();
    }

    g_output << "\n]\n";
    g_output.close();

    std::cout << "\nBenchmark results written to: " << output_file << "\n";
    return 0;
}
