#include "SummaryExport.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>

namespace {

// Round to 12 significant digits so exported values do not carry float noise
double round_val(double val) {
    if (val == 0.0 || !std::isfinite(val)) return val;
    double magnitude = std::pow(10.0, 11 - static_cast<int>(std::floor(std::log10(std::abs(val)))));
    return std::round(val * magnitude) / magnitude;
}

json spacings_json(const PhaseSpacings& s) {
    return json{{"d_ab", round_val(s.d_ab)}, {"d_bc", round_val(s.d_bc)}, {"d_ca", round_val(s.d_ca)}};
}

// Fields containing a comma or quote are quoted
std::string csv_field(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) return text;
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

std::vector<SummaryRow> summarize(const LineSolution& solution) {
    std::vector<SummaryRow> rows;
    if (solution.resistance) {
        rows.push_back({"Resistance (Ω/km)", solution.resistance->per_km});
        rows.push_back({"Resistance Total (Ω)", solution.resistance->total});
    }
    if (solution.inductance) {
        rows.push_back({"Inductance (H/km)", solution.inductance->per_km});
        rows.push_back({"Inductance Total (H)", solution.inductance->total});
    }
    if (solution.capacitance) {
        rows.push_back({"Capacitance (F/km)", solution.capacitance->per_km});
        rows.push_back({"Capacitance Total (F)", solution.capacitance->total});
    }
    return rows;
}

void write_summary_csv(std::ostream& out, const std::vector<SummaryRow>& rows) {
    out << "Parameter,Value\n";
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();
    out << std::setprecision(12);
    for (const auto& row : rows) {
        out << csv_field(row.parameter) << "," << row.value << "\n";
    }
    out.flags(flags);
    out.precision(precision);
}

json to_json(const LineSolution& solution) {
    json j;
    j["name"] = solution.name;
    j["results"] = json::object();

    if (solution.resistance) {
        const ResistanceResult& r = *solution.resistance;
        j["results"]["resistance"] = {
            {"rho2", round_val(r.rho2)},
            {"per_km", round_val(r.per_km)},
            {"total", round_val(r.total)}};
    }
    if (solution.inductance) {
        const InductanceResult& l = *solution.inductance;
        json node = {
            {"gmr", round_val(l.gmr)},
            {"gmd", round_val(l.gmd)},
            {"per_km", round_val(l.per_km)},
            {"total", round_val(l.total)}};
        if (l.spacings) node["spacings"] = spacings_json(*l.spacings);
        j["results"]["inductance"] = node;
    }
    if (solution.capacitance) {
        const CapacitanceResult& c = *solution.capacitance;
        json node = {
            {"gmd", round_val(c.gmd)},
            {"d_eq", round_val(c.d_eq)},
            {"per_km", round_val(c.per_km)},
            {"total", round_val(c.total)}};
        if (c.image_distance) node["image_distance"] = round_val(*c.image_distance);
        if (c.spacings) node["spacings"] = spacings_json(*c.spacings);
        j["results"]["capacitance"] = node;
    }

    j["errors"] = solution.errors;
    return j;
}

size_t save_solutions(const std::vector<LineSolution>& results, const std::string& output_dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Failed to create " << output_dir << ": " << ec.message() << std::endl;
        return 0;
    }

    std::set<std::string> used;
    size_t written = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        std::string base = results[i].stem.empty() ? "case_" + std::to_string(i) : results[i].stem;
        if (!used.insert(base).second) {
            base += "_" + std::to_string(i);
            used.insert(base);
        }

        fs::path filename = fs::path(output_dir) / (base + "_sol.json");
        std::ofstream out(filename);
        if (out.is_open()) {
            out << to_json(results[i]).dump(4);
            ++written;
        } else {
            std::cerr << "Failed to write " << filename << std::endl;
        }
    }
    return written;
}
