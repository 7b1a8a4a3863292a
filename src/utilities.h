#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>
#include <cmath>

#include <Random123/philox.h>
#include <Random123/uniform.hpp>



// -------------------- R123Rng --------------------
class R123Rng {
public:
    typedef r123::Philox4x32 RNG;
    typedef RNG::ctr_type ctr_type;
    typedef RNG::key_type key_type;

private:
    RNG rng;
    ctr_type ctr;
    key_type key;
    ctr_type buffer;
    int buf_index = 4; // consume all initially (forces first refill)

public:
    R123Rng(); // default constructor
    R123Rng(uint64_t seed, uint64_t stream = 0);

    // Draw a uniform double in (0,1]
    double uniform();

    // Standard normal deviate (Box-Muller, second value of the pair is discarded)
    double normal();

    // Manually increment 128-bit counter
    void increment();

    // Reset/seed the RNG
    void reseed(uint64_t seed, uint64_t stream = 0);

    // Fork a new RNG with modified stream ID (for particles)
    R123Rng fork(uint64_t stream_offset) const;
};


// -------------------- Field2D --------------------
// Square N x N array of nodal values, row-major with y fastest: (i, j) -> i*N + j.
struct Field2D {
    int n = 0;
    std::vector<double> data;

    Field2D() = default;
    explicit Field2D(int n_, double init_value = 0.0) : n(n_), data(static_cast<size_t>(n_) * n_, init_value) {}

    double& operator()(int i, int j) { return data[static_cast<size_t>(i) * n + j]; }
    double  operator()(int i, int j) const { return data[static_cast<size_t>(i) * n + j]; }

    void fill(double v);
    double sum() const;
    double max_abs() const;

    size_t size() const { return data.size(); }
};

// max |a - b| over all nodes; arrays must have the same shape
double max_abs_diff(const Field2D& a, const Field2D& b);

// -------------------- Generic N-D array wrapper --------------------
struct NDArray {
    std::vector<size_t> dims;     // e.g., {S, XI, PZ}
    std::vector<size_t> strides;  // row-major
    std::vector<double> data;     // flat storage

    static std::vector<size_t> make_strides(const std::vector<size_t>& d);
    void resize(const std::vector<size_t>& d, double init_value = 0.0);
    size_t flat_index(const std::vector<size_t>& idx) const;
    double& at(const std::vector<size_t>& idx);
    const double& at(const std::vector<size_t>& idx) const;

    size_t size() const { return data.size(); }
};

// -------------------- Generic tally dimension descriptions --------

// A numeric binned dimension: e.g. "xi", "pz".
struct TallyDim {
    std::string       name;   // label, e.g. "xi"
    std::vector<double> edges; // bin edges (>= 2)
};

// A single coordinate along a named dimension: {"pz", 5.0}
struct DimCoord {
    std::string name;
    double      value;
};

// -------------------- Tally --------------------
class Tally {
public:
    std::string              tally_name;     // e.g., "beam_spectrum"
    std::vector<std::string> species;        // species labels (first dimension)

    // Generic numeric binned dimensions (xi, pz, ...)
    std::vector<TallyDim> dims;              // order = NDArray dimension order (after species)

    // Built on finalize()
    std::unordered_map<std::string, int> species_index; // label -> species index
    NDArray counts;                                     // dims = {S, N0, N1, ...}

    // Build indices and allocate counts
    void finalize();

    // Add a contribution at a point in all dimensions.
    // coords gives values for each named dimension.
    bool add(const std::string& sp,
             const std::vector<DimCoord>& coords,
             double contribution = 1.0);

    // Retrieve the value at a point (same interface as add, but read-only).
    double retrieve(const std::string& sp,
                    const std::vector<DimCoord>& coords) const;

    // Factory that returns a ready-to-use Tally (throws on invalid input)
    static Tally Make(std::string name,
                      std::vector<std::string> species_labels,
                      std::vector<TallyDim>   dimensions);

private:
    bool bin_coords(const std::string& sp,
                    const std::vector<DimCoord>& coords,
                    std::vector<size_t>& idx) const;
};


// ---------- CLI ----------
struct Cli {
    std::filesystem::path input;
    std::filesystem::path output; // may be empty until defaulted
    std::filesystem::path resume; // checkpoint to continue from, optional
};

// Prints usage text
void print_usage(const char* exe);

// Replace any existing extension on a path with ".h5"
std::filesystem::path with_h5_extension(std::filesystem::path p);

// Parse command line flags into Cli
bool parse_args(int argc, char** argv, Cli& cli);


// ---------- plasma units ----------
// Scales of the normalisation for a plasma of electron density n0 [cm^-3].
struct PlasmaScales {
    double omega_p    = 0.0; // rad/s
    double skin_depth = 0.0; // c/omega_p [m]
    double e0_field   = 0.0; // m_e c omega_p / e [V/m]
};

PlasmaScales plasma_scales(double density_cm3);

// Electron rest energy in MeV
double electron_rest_energy_mev();

// Longitudinal momentum [m c] of a particle of mass `mass` [m_e] and kinetic energy [MeV]
double kinetic_energy_2_pz(double energy_mev, double mass);


// -------------------- Binning helper --------------------
// Given monotonically increasing bin *edges* (length N), return the bin index
// in [0..N-2] for value x. If x is exactly the last edge, return N-2.
// Returns -1 if x is out of range.
int bin_index_from_edges(const std::vector<double>& edges, double x);

// Uniformly spaced edges: lo, ..., hi with `bins` bins
std::vector<double> linear_edges(double lo, double hi, int bins);
