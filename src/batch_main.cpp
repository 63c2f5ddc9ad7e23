#include "BatchSolver.hpp"
#include "SummaryExport.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    std::string cases_dir;
    std::string output_dir = "line_results";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--cases" && i + 1 < argc) {
            cases_dir = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            output_dir = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0] << " [--cases <dir>] [--out <dir>]" << std::endl;
            return 1;
        }
    }

    if (cases_dir.empty()) {
        cases_dir = "cases";
        if (!fs::exists(cases_dir)) {
            cases_dir = "../cases";
        }
    }
    if (!fs::exists(cases_dir)) {
        std::cerr << "Error: '" << cases_dir << "' directory not found." << std::endl;
        return 1;
    }

    std::vector<LineCase> batch;
    std::cout << "Loading line cases from " << cases_dir << "..." << std::endl;
    for (const auto& entry : fs::directory_iterator(cases_dir)) {
        if (entry.path().extension() == ".json") {
            LineCase line_case;
            if (line_case.load_from_json(entry.path().string())) {
                batch.push_back(line_case);
                std::cout << "  Loaded " << line_case.name << std::endl;
            }
        }
    }

    std::cout << "Solving batch of " << batch.size() << " line cases (OpenMP)..." << std::endl;

    auto start_time = std::chrono::high_resolution_clock::now();
    std::vector<LineSolution> results = solve_batch(batch);
    auto end_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end_time - start_time;

    std::cout << "Batch solved in " << elapsed.count() << " ms" << std::endl;

    std::cout << "[Verification]" << std::endl;
    for (const auto& res : results) {
        std::cout << "  " << res.name << ": " << summarize(res).size() << " parameters computed";
        if (!res.ok()) {
            std::cout << ", " << res.errors.size() << " group(s) rejected";
        }
        std::cout << std::endl;
    }

    size_t saved = save_solutions(results, output_dir);
    std::cout << "Saved " << saved << " of " << results.size() << " results to " << output_dir << "/" << std::endl;

    return 0;
}
