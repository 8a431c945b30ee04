#pragma once

#include <complex>
#include <fstream>
#include <string>
#include <vector>

#include "qenv/exponential.hpp"

namespace qenv::io {

// Columns x,re,im (re only when `values` is real).
void write_csv_samples(std::ostream& os,
                       const std::vector<double>& x,
                       const std::vector<std::complex<double>>& values,
                       int precision = 17);
void write_csv_samples(std::ostream& os,
                       const std::vector<double>& x,
                       const std::vector<double>& values,
                       int precision = 17);

// Columns type,ck_re,ck_im,vk_re,vk_im,ck2_re,ck2_im (ck2 empty unless RI).
void write_csv_exponents(std::ostream& os,
                         const std::vector<CFExponent>& exponents,
                         int precision = 17);

// Inverse of write_csv_exponents. The type column goes through
// parse_exponent_type; a bad row throws std::runtime_error naming source:line.
std::vector<CFExponent> read_csv_exponents(std::istream& is, const std::string& source = "<stream>");
std::vector<CFExponent> read_csv_exponents(const std::string& path);

// Reads "x,re[,im]" rows; a leading header line and blank lines are skipped.
struct Samples {
    std::vector<double> x;
    std::vector<std::complex<double>> values;
};
Samples read_csv_samples(std::istream& is, const std::string& source = "<stream>");
Samples read_csv_samples(const std::string& path);

// Opens `path` for writing or throws std::runtime_error.
std::ofstream open_output(const std::string& path);

} // namespace qenv::io
