#ifndef SUMMARY_EXPORT_HPP
#define SUMMARY_EXPORT_HPP

#include "LineSolver.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

using json = nlohmann::json;

struct SummaryRow {
    std::string parameter;
    double value;
};

// One row per computed scalar: R/km, R total, L/km, L total, C/km, C total.
// Groups that failed or were not requested contribute no rows.
std::vector<SummaryRow> summarize(const LineSolution& solution);

// "Parameter,Value" header followed by one line per row.
void write_summary_csv(std::ostream& out, const std::vector<SummaryRow>& rows);

// Full solution document, including intermediate quantities and group errors.
json to_json(const LineSolution& solution);

// Writes one <stem>_sol.json per solution into output_dir. Solutions without a
// stem are written as case_<index>; a repeated stem gets the index appended, so
// no solution overwrites another. Returns the number of files written.
size_t save_solutions(const std::vector<LineSolution>& results, const std::string& output_dir);

#endif // SUMMARY_EXPORT_HPP
