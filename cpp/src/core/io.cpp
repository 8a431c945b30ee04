#include "qenv/io.hpp"

#include "qenv/errors.hpp"

#include <iomanip>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace qenv::io {

namespace {

void set_precision(std::ostream& os, int precision) {
    os.setf(std::ios::scientific, std::ios::floatfield);
    os << std::setprecision(precision);
}

void require_same_length(std::size_t nx, std::size_t nv) {
    if (nx != nv) throw std::invalid_argument("write_csv_samples: x and values differ in length");
}

} // namespace

void write_csv_samples(std::ostream& os,
                       const std::vector<double>& x,
                       const std::vector<std::complex<double>>& values,
                       int precision) {
    require_same_length(x.size(), values.size());
    set_precision(os, precision);
    os << "x,re,im\n";
    for (std::size_t k = 0; k < x.size(); ++k) {
        os << x[k] << "," << values[k].real() << "," << values[k].imag() << "\n";
    }
}

void write_csv_samples(std::ostream& os,
                       const std::vector<double>& x,
                       const std::vector<double>& values,
                       int precision) {
    require_same_length(x.size(), values.size());
    set_precision(os, precision);
    os << "x,re\n";
    for (std::size_t k = 0; k < x.size(); ++k) {
        os << x[k] << "," << values[k] << "\n";
    }
}

void write_csv_exponents(std::ostream& os,
                         const std::vector<CFExponent>& exponents,
                         int precision) {
    set_precision(os, precision);
    os << "type,ck_re,ck_im,vk_re,vk_im,ck2_re,ck2_im\n";
    for (const auto& e : exponents) {
        os << to_string(e.type()) << ","
           << e.ck().real() << "," << e.ck().imag() << ","
           << e.vk().real() << "," << e.vk().imag() << ",";
        if (e.ck2()) os << e.ck2()->real() << "," << e.ck2()->imag();
        else os << ",";
        os << "\n";
    }
}

std::vector<CFExponent> read_csv_exponents(std::istream& is, const std::string& source) {
    std::vector<CFExponent> out;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(is, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        if (lineno == 1 && line.rfind("type,", 0) == 0) continue;  // header
        const std::string where = source + ":" + std::to_string(lineno) + ": ";

        std::istringstream row(line);
        std::vector<std::string> cells;
        std::string cell;
        while (std::getline(row, cell, ',')) cells.push_back(cell);
        if (!line.empty() && line.back() == ',') cells.emplace_back();
        if (cells.size() != 7) throw std::runtime_error(where + "expected 7 fields, got " + std::to_string(cells.size()));

        auto number = [&](std::size_t k) {
            try {
                return std::stod(cells[k]);
            } catch (const std::exception&) {
                throw std::runtime_error(where + "non-numeric field " + std::to_string(k + 1));
            }
        };
        try {
            const CFExponent::Type type = parse_exponent_type(cells[0]);
            const std::complex<double> ck(number(1), number(2));
            const std::complex<double> vk(number(3), number(4));
            std::optional<std::complex<double>> ck2;
            if (type == CFExponent::Type::RI) ck2 = std::complex<double>(number(5), number(6));
            out.emplace_back(type, ck, vk, ck2);
        } catch (const InvalidExponentSpec& ex) {
            throw std::runtime_error(where + ex.what());
        }
    }
    return out;
}

std::vector<CFExponent> read_csv_exponents(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("Failed to open input file: " + path);
    return read_csv_exponents(ifs, path);
}

Samples read_csv_samples(std::istream& is, const std::string& source) {
    Samples out;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(is, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::istringstream row(line);
        std::string cell;
        std::vector<double> cols;
        bool numeric = true;
        while (std::getline(row, cell, ',')) {
            try {
                std::size_t used = 0;
                cols.push_back(std::stod(cell, &used));
            } catch (const std::exception&) {
                numeric = false;
                break;
            }
        }
        if (!numeric) {
            if (lineno == 1) continue;  // header
            throw std::runtime_error(source + ":" + std::to_string(lineno) + ": non-numeric field");
        }
        if (cols.size() < 2 || cols.size() > 3) {
            throw std::runtime_error(source + ":" + std::to_string(lineno) + ": expected x,re[,im]");
        }
        out.x.push_back(cols[0]);
        out.values.emplace_back(cols[1], cols.size() == 3 ? cols[2] : 0.0);
    }
    return out;
}

Samples read_csv_samples(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("Failed to open input file: " + path);
    return read_csv_samples(ifs, path);
}

std::ofstream open_output(const std::string& path) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) throw std::runtime_error("Failed to open output file: " + path);
    return ofs;
}

} // namespace qenv::io
