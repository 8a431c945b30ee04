#include "qenv/fit.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace qenv::fit {

namespace {

enum class Align { Left, Center, Right };

std::string pad(const std::string& s, std::size_t width, Align align) {
    if (s.size() >= width) return s;
    const std::size_t fill = width - s.size();
    switch (align) {
        case Align::Left: return s + std::string(fill, ' ');
        case Align::Right: return std::string(fill, ' ') + s;
        case Align::Center: break;
    }
    return std::string(fill / 2, ' ') + s + std::string(fill - fill / 2, ' ');
}

// "%.2e", optionally with a blank in place of the '+' sign.
std::string sci(double v, bool space_sign) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), space_sign ? "% .2e" : "%.2e", v);
    return buf;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace

std::string summary(double time,
                    double rmse,
                    std::size_t N,
                    const std::string& label,
                    const Parameters& params,
                    const std::vector<std::string>& columns) {
    if (columns.size() != 3 && columns.size() != 4) {
        throw std::invalid_argument("summary: expected 3 or 4 columns");
    }
    if (params.size() < columns.size()) {
        throw std::invalid_argument("summary: fewer parameter kinds than columns");
    }
    const std::size_t last = columns.size() - 1;

    std::string out = "Result of fitting " + label + " with " + std::to_string(N) + " terms: \n \n "
                      + pad("Parameters", 10, Align::Left) + "|";
    for (std::size_t j = 0; j < last; ++j) out += pad(columns[j], 10, Align::Center) + "|";
    out += pad(columns[last], 5, Align::Right) + " \n ";

    const std::size_t terms = params[0].size();
    for (std::size_t k = 0; k < terms; ++k) {
        out += pad(std::to_string(k + 1), 10, Align::Left) + "|";
        out += pad(sci(params[0][k], true), 10, Align::Center) + "|";
        for (std::size_t j = 1; j < last; ++j) out += pad(sci(params[j][k], false), 10, Align::Center) + "|";
        out += pad(sci(params[last][k], false), 5, Align::Right) + "\n ";
    }

    char time_buf[64];
    std::snprintf(time_buf, sizeof(time_buf), "% 2f", time);
    out += "\nA  normalized RMSE of " + sci(rmse, true) + " was obtained for the " + label + "\n";
    out += " The current fit took " + std::string(time_buf) + " seconds";
    return out;
}

std::string two_column_summary(const Parameters& params_real,
                               const Parameters& params_imag,
                               double fit_time_real,
                               double fit_time_imag,
                               std::size_t Nr,
                               std::size_t Ni,
                               double rmse_imag,
                               double rmse_real,
                               std::size_t n) {
    std::vector<std::string> columns{"a", "b", "c"};
    if (n == 4) columns.push_back("d");

    auto lines_real = split_lines(summary(fit_time_real, rmse_real, Nr,
                                          "The Real Part Of  \n the Correlation Function",
                                          params_real, columns));
    auto lines_imag = split_lines(summary(fit_time_imag, rmse_imag, Ni,
                                          "The Imaginary Part \n Of the Correlation Function",
                                          params_imag, columns));

    // Pad the shorter column with blank lines above its closing line.
    const std::size_t rows = std::max(lines_real.size(), lines_imag.size());
    for (auto* lines : {&lines_real, &lines_imag}) {
        lines->insert(lines->end() - 1, rows - lines->size(), std::string());
    }

    std::size_t width_real = 0, width_imag = 0;
    for (const auto& l : lines_real) width_real = std::max(width_real, l.size());
    for (const auto& l : lines_imag) width_imag = std::max(width_imag, l.size());

    std::string out = "Fit correlation class instance: \n \n";
    for (std::size_t i = 0; i < rows; ++i) {
        out += pad(lines_real[i], width_real, Align::Left) + " |" + pad(lines_imag[i], width_imag, Align::Left) + "\n";
    }
    return out;
}

} // namespace qenv::fit
