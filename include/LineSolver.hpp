#ifndef LINESOLVER_HPP
#define LINESOLVER_HPP

#include "LineCase.hpp"
#include <map>
#include <optional>
#include <string>

struct LineSolution {
    std::string name;
    std::string stem; // source case file stem, empty for in-memory cases
    std::optional<ResistanceResult> resistance;
    std::optional<InductanceResult> inductance;
    std::optional<CapacitanceResult> capacitance;
    std::map<std::string, std::string> errors; // group name -> InvalidInput message

    bool ok() const { return errors.empty(); }
};

class LineSolver {
public:
    LineSolver(const LineCase& line_case);

    // Runs resistance, inductance and capacitance in that order. A group that
    // rejects its inputs is reported in LineSolution::errors and leaves the
    // other groups untouched.
    LineSolution solve();

private:
    const LineCase& case_;
};

#endif // LINESOLVER_HPP
