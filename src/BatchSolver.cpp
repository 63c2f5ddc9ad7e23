#include "BatchSolver.hpp"
#include <iostream>
#include <omp.h>

std::vector<LineSolution> solve_batch(const std::vector<LineCase>& cases) {
    std::vector<LineSolution> results(cases.size());

    // Each iteration owns its LineSolver and writes a distinct slot,
    // so the loop needs no locking.
    #pragma omp parallel for
    for (long i = 0; i < static_cast<long>(cases.size()); ++i) {
        LineSolver solver(cases[i]);

        try {
            results[i] = solver.solve();
        } catch (const std::exception& e) {
            std::cerr << "Error solving line case " << cases[i].name << ": " << e.what() << std::endl;
            // Keep the slot identifiable; no group results are reported for it
            results[i].name = cases[i].name;
            results[i].stem = cases[i].stem;
            results[i].errors["solver"] = e.what();
        }
    }

    return results;
}
