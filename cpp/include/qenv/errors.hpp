// errors.hpp — Exception types raised by environment construction, conversion and fitting

#pragma once

#include <stdexcept>
#include <string>

namespace qenv {

// A conversion path needs the temperature and the environment has none.
class MissingTemperature : public std::invalid_argument {
public:
    explicit MissingTemperature(const std::string& what) : std::invalid_argument(what) {}
};

// tMax / wMax is required for a transform-based conversion but was never given.
class MissingSupportBound : public std::invalid_argument {
public:
    explicit MissingSupportBound(const std::string& what) : std::invalid_argument(what) {}
};

class ShapeMismatch : public std::invalid_argument {
public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};

class InvalidExponentSpec : public std::invalid_argument {
public:
    explicit InvalidExponentSpec(const std::string& what) : std::invalid_argument(what) {}
};

// Only some of ck_real / vk_real / ck_imag / vk_imag were supplied.
class PartialListSpec : public std::invalid_argument {
public:
    explicit PartialListSpec(const std::string& what) : std::invalid_argument(what) {}
};

class UnknownMethod : public std::invalid_argument {
public:
    explicit UnknownMethod(const std::string& what) : std::invalid_argument(what) {}
};

// A special-function capability needed at evaluation time was not provided.
class MissingOptionalDependency : public std::runtime_error {
public:
    explicit MissingOptionalDependency(const std::string& what) : std::runtime_error(what) {}
};

// The term search of the fitter hit its ceiling before reaching the target error.
class MaxTermsExceeded : public std::runtime_error {
public:
    explicit MaxTermsExceeded(const std::string& what) : std::runtime_error(what) {}
};

} // namespace qenv
