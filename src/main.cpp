#include "LineSolver.hpp"
#include "SummaryExport.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_solution(const LineSolution& solution) {
    std::cout << "Line parameters for " << solution.name << ":" << std::endl;

    if (solution.resistance) {
        const ResistanceResult& r = *solution.resistance;
        std::cout << "  Resistance:" << std::endl;
        std::cout << "    Corrected resistivity rho2: " << std::scientific << std::setprecision(4) << r.rho2 << " Ohm*m" << std::endl;
        std::cout << "    Resistance per km: " << std::fixed << std::setprecision(6) << r.per_km << " Ohm/km" << std::endl;
        std::cout << "    Total resistance: " << std::fixed << std::setprecision(6) << r.total << " Ohm" << std::endl;
    }

    if (solution.inductance) {
        const InductanceResult& l = *solution.inductance;
        std::cout << "  Inductance:" << std::endl;
        if (l.spacings) {
            std::cout << "    Phase spacings: Dab=" << std::fixed << std::setprecision(3) << l.spacings->d_ab
                      << " m, Dbc=" << l.spacings->d_bc
                      << " m, Dca=" << l.spacings->d_ca << " m" << std::endl;
        }
        std::cout << "    GMR: " << std::fixed << std::setprecision(6) << l.gmr << " m" << std::endl;
        std::cout << "    GMD: " << std::fixed << std::setprecision(6) << l.gmd << " m" << std::endl;
        std::cout << "    Inductance per km: " << std::scientific << std::setprecision(6) << l.per_km << " H/km" << std::endl;
        std::cout << "    Total inductance: " << std::scientific << std::setprecision(6) << l.total << " H" << std::endl;
    }

    if (solution.capacitance) {
        const CapacitanceResult& c = *solution.capacitance;
        std::cout << "  Capacitance:" << std::endl;
        std::cout << "    GMD (effective): " << std::fixed << std::setprecision(6) << c.gmd << " m" << std::endl;
        if (c.image_distance) {
            std::cout << "    Equivalent height effect: " << std::fixed << std::setprecision(6) << *c.image_distance << " m" << std::endl;
        }
        std::cout << "    D_eq: " << std::fixed << std::setprecision(6) << c.d_eq << " m" << std::endl;
        std::cout << "    Capacitance per km: " << std::scientific << std::setprecision(6) << c.per_km << " F/km" << std::endl;
        std::cout << "    Total capacitance: " << std::scientific << std::setprecision(6) << c.total << " F" << std::endl;
    }

    for (const auto& pair : solution.errors) {
        std::cout << "  " << pair.first << " not computed: " << pair.second << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string filepath;
    std::string output_dir = "line_results";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--out" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (filepath.empty()) {
            filepath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (filepath.empty()) {
        std::cerr << "Usage: " << argv[0] << " <line_case_json> [--out <dir>]" << std::endl;
        return 1;
    }

    LineCase line_case;
    if (!line_case.load_from_json(filepath)) {
        return 1;
    }

    LineSolver solver(line_case);
    LineSolution solution = solver.solve();
    print_solution(solution);

    // Input: path/to/filename.json -> <output_dir>/filename_sol.json and filename_summary.csv
    std::string stem = fs::path(filepath).stem().string();
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << output_dir << ": " << ec.message() << std::endl;
        return 1;
    }

    fs::path json_path = fs::path(output_dir) / (stem + "_sol.json");
    fs::path csv_path = fs::path(output_dir) / (stem + "_summary.csv");

    std::cout << "Exporting solution to: " << json_path << std::endl;
    std::ofstream json_file(json_path);
    if (json_file.is_open()) {
        json_file << to_json(solution).dump(2) << std::endl;
    } else {
        std::cerr << "Failed to write solution file to " << json_path << std::endl;
    }

    std::cout << "Exporting summary to: " << csv_path << std::endl;
    std::ofstream csv_file(csv_path);
    if (csv_file.is_open()) {
        write_summary_csv(csv_file, summarize(solution));
    } else {
        std::cerr << "Failed to write summary file to " << csv_path << std::endl;
    }

    return 0;
}
