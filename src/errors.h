#pragma once
#include <stdexcept>
#include <string>

// Position outside the grid extent. Recovered locally by the boundary policy.
class OutOfDomainError : public std::runtime_error {
public:
    OutOfDomainError(double x_, double y_)
        : std::runtime_error("position (" + std::to_string(x_) + ", " + std::to_string(y_)
                             + ") is outside the grid extent"),
          x(x_), y(y_) {}

    double x;
    double y;
};

// Fixed-point iteration of a slice did not settle within the iteration cap.
class NonConvergenceError : public std::runtime_error {
public:
    NonConvergenceError(int slice_, int iterations_, double last_change_)
        : std::runtime_error("slice " + std::to_string(slice_) + ": fixed-point iteration did not converge after "
                             + std::to_string(iterations_) + " iterations (last change "
                             + std::to_string(last_change_) + ")"),
          slice(slice_), iterations(iterations_), last_change(last_change_) {}

    int    slice;
    int    iterations;
    double last_change;
};

// Deposited charge does not match the particle charge. Always fatal.
class InvalidSourceTermsError : public std::runtime_error {
public:
    InvalidSourceTermsError(int slice_, const std::string& what_)
        : std::runtime_error("slice " + std::to_string(slice_) + ": " + what_),
          slice(slice_) {}

    int slice;
};

// Bad or inconsistent input, raised before the run is initialized.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what_)
        : std::runtime_error(what_) {}
};
