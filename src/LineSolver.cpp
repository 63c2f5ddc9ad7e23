#include "LineSolver.hpp"
#include "CapacitanceModel.hpp"
#include "InductanceModel.hpp"
#include "ResistanceModel.hpp"
#include <iostream>

LineSolver::LineSolver(const LineCase& line_case) : case_(line_case) {}

LineSolution LineSolver::solve() {
    LineSolution solution;
    solution.name = case_.name;
    solution.stem = case_.stem;

    auto report = [&](const std::string& group, const InvalidInput& e) {
        std::cerr << "[" << case_.name << "] " << group << ": " << e.what() << std::endl;
        solution.errors[group] = e.what();
    };

    if (case_.resistance) {
        try {
            solution.resistance = compute_resistance(case_.resistance->conductor,
                                                     case_.resistance->conditions);
        } catch (const InvalidInput& e) {
            report("resistance", e);
        }
    }

    if (case_.inductance) {
        const InductanceInputs& in = *case_.inductance;
        try {
            solution.inductance = compute_inductance(in.radius_m, in.gmr_m, in.geometry, in.length_km);
        } catch (const InvalidInput& e) {
            report("inductance", e);
        }
    }

    if (case_.capacitance) {
        const CapacitanceInputs& in = *case_.capacitance;
        try {
            solution.capacitance = compute_capacitance(in.radius_m, in.height_m, in.geometry, in.length_km);
        } catch (const InvalidInput& e) {
            report("capacitance", e);
        }
    }

    return solution;
}
