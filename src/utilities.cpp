#include "utilities.h"

#include <iostream>
#include <cstdlib>
#include <string>
#include <cmath>
#include <utility>
#include <algorithm>
#include <stdexcept>

// Draco includes
#include "units/PhysicalConstantsSI.hh"



// -------------------- R123Rng Implementation --------------------

R123Rng::R123Rng() {
    reseed(0, 0);
}

R123Rng::R123Rng(uint64_t seed, uint64_t stream) {
    reseed(seed, stream);
}

void R123Rng::reseed(uint64_t seed, uint64_t stream) {
    key = key_type{{static_cast<uint32_t>(seed & 0xffffffffu),
                    static_cast<uint32_t>(seed >> 32)}};
    ctr = ctr_type{{static_cast<uint32_t>(stream & 0xffffffffu),
                    static_cast<uint32_t>(stream >> 32),
                    0u, 0u}};
    buf_index = 4;
}

void R123Rng::increment() {
    if (++ctr[0] == 0u) {
        if (++ctr[1] == 0u) {
            if (++ctr[2] == 0u) {
                ++ctr[3];
            }
        }
    }
}

double R123Rng::uniform() {
    if (buf_index >= 4) {
        buffer = rng(ctr, key);
        buf_index = 0;
        increment();
    }
    return r123::u01<double>(buffer[buf_index++]);
}

double R123Rng::normal() {
    // u01 never returns 0, so the log is finite
    const double u1 = uniform();
    const double u2 = uniform();
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * M_PI * u2);
}

R123Rng R123Rng::fork(uint64_t stream_offset) const {
    // create a copy with different stream ID (e.g., particle ID)
    R123Rng new_rng;
    new_rng.key = this->key;
    new_rng.ctr = this->ctr;
    new_rng.ctr[2] = static_cast<uint32_t>(stream_offset & 0xffffffffu);
    new_rng.ctr[3] = static_cast<uint32_t>(stream_offset >> 32);
    new_rng.buf_index = 4;
    return new_rng;
}


// -------------------- Field2D impl --------------------

void Field2D::fill(double v) {
    std::fill(data.begin(), data.end(), v);
}

double Field2D::sum() const {
    double s = 0.0;
    for (double v : data) s += v;
    return s;
}

double Field2D::max_abs() const {
    double m = 0.0;
    for (double v : data) m = std::max(m, std::abs(v));
    return m;
}

double max_abs_diff(const Field2D& a, const Field2D& b) {
    if (a.n != b.n) {
        throw std::invalid_argument("max_abs_diff: arrays differ in shape.");
    }
    double m = 0.0;
    for (size_t k = 0; k < a.data.size(); ++k) {
        m = std::max(m, std::abs(a.data[k] - b.data[k]));
    }
    return m;
}


// -------------------- Tally impl --------------------

void Tally::finalize() {
    // Build species lookup
    species_index.clear();
    for (int i = 0; i < static_cast<int>(species.size()); ++i) {
        species_index[species[i]] = i;
    }

    // Default numeric bin edges if not provided
    for (auto &d : dims) {
        if (d.edges.size() < 2) {
            d.edges.clear();
            d.edges.push_back(0.0);
            d.edges.push_back(1e20);
        }
    }

    // Build NDArray shape: {S, N0, N1, ...}
    std::vector<size_t> nd_dims;
    nd_dims.reserve(1 + dims.size());
    nd_dims.push_back(species.size());
    for (size_t d = 0; d < dims.size(); ++d) {
        nd_dims.push_back(dims[d].edges.size() - 1); // number of bins
    }

    counts.resize(nd_dims, 0.0);
}

bool Tally::bin_coords(const std::string& sp,
                       const std::vector<DimCoord>& coords,
                       std::vector<size_t>& idx) const
{
    std::unordered_map<std::string,int>::const_iterator it_s = species_index.find(sp);
    if (it_s == species_index.end()) return false;

    idx.clear();
    idx.reserve(1 + dims.size());
    idx.push_back(static_cast<size_t>(it_s->second)); // species index is first

    // coords is short, a linear search per dimension is enough
    for (size_t d = 0; d < dims.size(); ++d) {
        const std::string& dim_name = dims[d].name;

        bool   found = false;
        double value = 0.0;
        for (size_t i = 0; i < coords.size(); ++i) {
            if (coords[i].name == dim_name) {
                value = coords[i].value;
                found = true;
                break;
            }
        }
        if (!found) return false; // missing coordinate for this dimension

        int b = bin_index_from_edges(dims[d].edges, value);
        if (b < 0) return false; // out of range

        idx.push_back(static_cast<size_t>(b));
    }
    return true;
}

bool Tally::add(const std::string& sp,
                const std::vector<DimCoord>& coords,
                double contribution)
{
    std::vector<size_t> idx;
    if (!bin_coords(sp, coords, idx)) return false;
    counts.at(idx) += contribution;
    return true;
}

double Tally::retrieve(const std::string& sp,
                       const std::vector<DimCoord>& coords) const
{
    std::vector<size_t> idx;
    if (!bin_coords(sp, coords, idx)) return 0.0;
    return counts.at(idx);
}

Tally Tally::Make(std::string name,
                  std::vector<std::string> species_labels,
                  std::vector<TallyDim>   dimensions)
{
    if (species_labels.empty()) {
        throw std::invalid_argument("Tally::Make: species list must not be empty.");
    }

    Tally t;
    t.tally_name     = std::move(name);
    t.species        = std::move(species_labels);
    t.dims           = std::move(dimensions);
    t.finalize();
    return t;
}


// ------------------------ helpers ------------------------

void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " -i <input_file> [-o <output_path>] [--resume <checkpoint.h5>]\n\n"
        << "Examples:\n"
        << "  " << exe << " -i path/to/input/wake.txt -o path/to/output/wake.h5\n"
        << "  " << exe << " -i wake.txt\n"
        << "  " << exe << " -i wake.txt -o wake_out   (auto .h5)\n"
        << "  " << exe << " -i wake.txt --resume wake_checkpoint.h5\n";
}

std::filesystem::path with_h5_extension(std::filesystem::path p) {
    p.replace_extension(".h5");
    return p;
}

bool parse_args(int argc, char** argv, Cli& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-i" || a == "--input") {
            if (i + 1 >= argc) {
                std::cerr << "ERROR: Missing value after " << a << "\n";
                return false;
            }
            cli.input = std::filesystem::path(argv[++i]);
        } else if (a == "-o" || a == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "ERROR: Missing value after " << a << "\n";
                return false;
            }
            cli.output = std::filesystem::path(argv[++i]);
        } else if (a == "-r" || a == "--resume") {
            if (i + 1 >= argc) {
                std::cerr << "ERROR: Missing value after " << a << "\n";
                return false;
            }
            cli.resume = std::filesystem::path(argv[++i]);
        } else if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            std::exit(EXIT_SUCCESS);
        } else {
            std::cerr << "WARN: Unrecognized argument ignored: " << a << "\n";
        }
    }

    if (cli.input.empty()) {
        std::cerr << "ERROR: No input file provided. Use -i <input_file>.\n";
        return false;
    }

    // If -o not provided: default to input path with .h5 extension.
    // If -o provided: force .h5 extension regardless of user suffix.
    if (cli.output.empty()) {
        cli.output = with_h5_extension(cli.input);
    } else {
        cli.output = with_h5_extension(cli.output);
    }

    return true;
}


PlasmaScales plasma_scales(double density_cm3) {
    PlasmaScales s;
    if (!(density_cm3 > 0.0)) return s;

    const double n_m3 = density_cm3 * 1.0e6;
    const double mu0  = 4.0e-7 * M_PI;
    const double eps0 = 1.0 / (mu0 * rtt_units::cLightSI * rtt_units::cLightSI);
    const double e    = rtt_units::electronChargeSI;
    const double me   = rtt_units::electronMassSI;

    s.omega_p    = std::sqrt(n_m3 * e * e / (eps0 * me));
    s.skin_depth = rtt_units::cLightSI / s.omega_p;
    s.e0_field   = me * rtt_units::cLightSI * s.omega_p / e;
    return s;
}

double electron_rest_energy_mev() {
    return rtt_units::electronMassSI * rtt_units::cLightSI * rtt_units::cLightSI
           / rtt_units::electronChargeSI * 1.0e-6;
}

double kinetic_energy_2_pz(double energy_mev, double mass) {
    // gamma m c^2 = E_kin + m c^2, pz = m sqrt(gamma^2 - 1)
    const double rest  = mass * electron_rest_energy_mev();
    const double gamma = 1.0 + energy_mev / rest;
    return mass * std::sqrt(gamma * gamma - 1.0);
}


// -------------------- NDArray impl --------------------
std::vector<size_t> NDArray::make_strides(const std::vector<size_t>& d) {
    std::vector<size_t> s(d.size(), 1);
    if (d.empty()) return s;
    for (int i = static_cast<int>(d.size()) - 2; i >= 0; --i) {
        s[i] = s[i + 1] * d[i + 1];
    }
    return s;
}

void NDArray::resize(const std::vector<size_t>& d, double init_value) {
    dims = d;
    strides = make_strides(dims);
    size_t total = 1;
    for (auto v : dims) total *= v;
    data.assign(total, init_value);
}

size_t NDArray::flat_index(const std::vector<size_t>& idx) const {
    size_t off = 0;
    for (size_t i = 0; i < idx.size(); ++i) {
        off += idx[i] * strides[i];
    }
    return off;
}

double& NDArray::at(const std::vector<size_t>& idx) {
    return data[flat_index(idx)];
}

const double& NDArray::at(const std::vector<size_t>& idx) const {
    return data[flat_index(idx)];
}

// -------------------- Binning helper impl --------------------
int bin_index_from_edges(const std::vector<double>& edges, double x) {
    const size_t N = edges.size();
    if (N < 2) return -1;

    // Require x within [edges.front(), edges.back()]
    if (x < edges.front()) return -1;
    if (x > edges.back())  return -1;

    // Include exact upper edge in the last bin
    if (x == edges.back()) return static_cast<int>(N) - 2;

    // First edge strictly greater than x, step back one
    auto it = std::upper_bound(edges.begin(), edges.end(), x);
    if (it == edges.begin()) return -1; // shouldn't happen due to earlier check
    return static_cast<int>(std::distance(edges.begin(), it)) - 1;
}

std::vector<double> linear_edges(double lo, double hi, int bins) {
    if (bins < 1) throw std::invalid_argument("linear_edges: bins must be >= 1");
    if (!(hi > lo)) throw std::invalid_argument("linear_edges: upper bound must be > lower bound");
    std::vector<double> edges(static_cast<size_t>(bins) + 1);
    const double step = (hi - lo) / bins;
    for (int i = 0; i <= bins; ++i) edges[i] = lo + step * i;
    edges.back() = hi; // avoid last-step floating error
    return edges;
}
