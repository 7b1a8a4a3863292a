// io.cpp
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <array>
#include <utility>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <system_error>

#include "utilities.h"
#include "garage.h"
#include "io.h"
#include "errors.h"
#include "loop.h"
#include "diagnostics.h"

// HDF5 C API is a C library; wrap in extern "C" for C++ builds
extern "C" {
#include <hdf5.h>
}


// ------------------------ Parsing helpers (file-local) ----------------------

static std::string trim(std::string s) {
    auto isws = [](unsigned char c){ return std::isspace(c); };
    while (!s.empty() && isws(s.front())) s.erase(s.begin());
    while (!s.empty() && isws(s.back()))  s.pop_back();
    return s;
}

static std::vector<std::string> split_ws(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tok;
    std::string t;
    while (iss >> t) tok.push_back(t);
    return tok;
}

static bool is_number(const std::string &s) {
    char* end=nullptr;
    std::strtod(s.c_str(), &end);
    return !s.empty() && end && *end=='\0';
}

static double to_double(const std::string& s) {
    if (!is_number(s)) throw std::invalid_argument("not a number: '" + s + "'");
    return std::stod(s);
}

static int to_int(const std::string& s) {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("not an integer: '" + s + "'");
    return v;
}

static uint64_t to_u64(const std::string& s) {
    size_t pos = 0;
    unsigned long long v = std::stoull(s, &pos);
    if (pos != s.size() || s.front() == '-') throw std::invalid_argument("not an unsigned integer: '" + s + "'");
    return static_cast<uint64_t>(v);
}

static bool to_bool(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true"  || s == "yes" || s == "on")  return true;
    if (s == "0" || s == "false" || s == "no"  || s == "off") return false;
    throw std::invalid_argument("not a boolean: '" + s + "'");
}


// ----------------------------- Input parsing --------------------------------

bool parse_input_file(const std::filesystem::path& path, Garage& g) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "ERROR: Cannot open input file: " << path << "\n";
        return false;
    }

    enum class Section { None, Grid, Plasma, Ions, Beam, Stepping, Solver, Diagnostics, Checkpoint };
    Section sec = Section::None;

    int xi_steps = 0;  // resolved into xi_end once xi_step is known

    std::string line;
    while (std::getline(in, line)) {
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        // section headers
        if (line.front() == '[' && line.back() == ']') {
            std::string name = line.substr(1, line.size()-2);

            if      (name == "grid")        sec = Section::Grid;
            else if (name == "plasma")      sec = Section::Plasma;
            else if (name == "ions")        sec = Section::Ions;
            else if (name == "beam")        sec = Section::Beam;
            else if (name == "stepping")    sec = Section::Stepping;
            else if (name == "solver")      sec = Section::Solver;
            else if (name == "diagnostics") sec = Section::Diagnostics;
            else if (name == "checkpoint")  sec = Section::Checkpoint;
            else {
                std::cerr << "WARN: Unrecognized section: " << line << "\n";
                sec = Section::None;
            }
            continue;
        }

        // content lines
        auto tok = split_ws(line);
        if (tok.empty()) continue;
        const std::string &key = tok[0];
        const bool one = (tok.size() == 2);

        try {
            switch (sec) {
            case Section::Grid: {
                if (key == "grid_steps" && one) {
                    g.grid_steps = to_int(tok[1]);
                } else if (key == "grid_step_size" && one) {
                    g.grid_step_size = to_double(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized grid line: " << line << "\n";
                }
            } break;

            case Section::Plasma: {
                if (key == "density" && one) {
                    g.plasma_density = to_double(tok[1]);
                } else if (key == "density_cm3" && one) {
                    g.plasma_density_cm3 = to_double(tok[1]);
                } else if (key == "coarseness" && one) {
                    g.plasma_coarseness = to_int(tok[1]);
                } else if (key == "fineness" && one) {
                    g.plasma_fineness = to_int(tok[1]);
                } else if (key == "padding_steps" && one) {
                    g.plasma_padding_steps = to_int(tok[1]);
                } else if (key == "reflect_padding_steps" && one) {
                    g.reflect_padding_steps = to_int(tok[1]);
                } else if (key == "boundary" && one) {
                    g.plasma_boundary = tok[1];
                } else if (key == "channel_depth" && one) {
                    g.channel_depth = to_double(tok[1]);
                } else if (key == "channel_radius" && one) {
                    g.channel_radius = to_double(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized plasma line: " << line << "\n";
                }
            } break;

            case Section::Ions: {
                if (key == "mode" && one) {
                    g.ion_mode = tok[1];
                } else if (key == "charge" && one) {
                    g.ion_charge = to_double(tok[1]);
                } else if (key == "mass" && one) {
                    g.ion_mass = to_double(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized ions line: " << line << "\n";
                }
            } break;

            case Section::Beam: {
                if (key == "particle" && tok.size() == 8) {
                    std::array<double,7> p;
                    for (size_t i = 0; i < 7; ++i) p[i] = to_double(tok[i + 1]);
                    g.beam_explicit.push_back(p);
                } else if (key == "charge" && one) {
                    g.beam_charge = to_double(tok[1]);
                } else if (key == "mass" && one) {
                    g.beam_mass = to_double(tok[1]);
                } else if (key == "density" && one) {
                    g.beam_density = to_double(tok[1]);
                } else if (key == "sigma_r" && one) {
                    g.beam_sigma_r = to_double(tok[1]);
                } else if (key == "sigma_xi" && one) {
                    g.beam_sigma_xi = to_double(tok[1]);
                } else if (key == "xi_center" && one) {
                    g.beam_xi_center = to_double(tok[1]);
                } else if (key == "energy_mev" && one) {
                    g.beam_energy_mev = to_double(tok[1]);
                } else if (key == "pz" && one) {
                    g.beam_pz = to_double(tok[1]);
                } else if (key == "divergence" && one) {
                    g.beam_divergence = to_double(tok[1]);
                } else if (key == "cut_sigmas" && one) {
                    g.beam_cut_sigmas = to_double(tok[1]);
                } else if (key == "particles" && one) {
                    g.beam_particles = to_int(tok[1]);
                } else if (key == "seed" && one) {
                    g.beam_seed = to_u64(tok[1]);
                } else if (key == "time_step" && one) {
                    g.beam_time_step = to_double(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized beam line: " << line << "\n";
                }
            } break;

            case Section::Stepping: {
                if (key == "xi_start" && one) {
                    g.xi_start = to_double(tok[1]);
                } else if (key == "xi_end" && one) {
                    g.xi_end = to_double(tok[1]);
                } else if (key == "xi_steps" && one) {
                    xi_steps = to_int(tok[1]);
                } else if (key == "xi_step" && one) {
                    g.xi_step = to_double(tok[1]);
                } else if (key == "min_xi_step" && one) {
                    g.min_xi_step = to_double(tok[1]);
                } else if (key == "max_retries" && one) {
                    g.max_retries = to_int(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized stepping line: " << line << "\n";
                }
            } break;

            case Section::Solver: {
                if (key == "subtraction_trick" && one) {
                    g.subtraction_trick = to_double(tok[1]);
                } else if (key == "tolerance" && one) {
                    g.tolerance = to_double(tok[1]);
                } else if (key == "max_iterations" && one) {
                    g.max_iterations = to_int(tok[1]);
                } else if (key == "min_iterations" && one) {
                    g.min_iterations = to_int(tok[1]);
                } else if (key == "fine_refresh" && one) {
                    g.fine_refresh = tok[1];
                } else if (key == "charge_tolerance" && one) {
                    g.charge_tolerance = to_double(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized solver line: " << line << "\n";
                }
            } break;

            case Section::Diagnostics: {
                if (key == "each_n_slices" && one) {
                    g.diagnostics_each_n_slices = to_int(tok[1]);
                } else if (key == "snapshots" && one) {
                    g.diagnostics_snapshots = to_bool(tok[1]);
                } else if (key == "quiet" && one) {
                    g.quiet = to_bool(tok[1]);
                } else {
                    std::cerr << "WARN: Unrecognized diagnostics line: " << line << "\n";
                }
            } break;

            case Section::Checkpoint: {
                if (key == "each_n_slices" && one) {
                    g.checkpoint_each_n_slices = to_int(tok[1]);
                } else if (key == "path" && one) {
                    g.checkpoint_path = tok[1];
                } else {
                    std::cerr << "WARN: Unrecognized checkpoint line: " << line << "\n";
                }
            } break;

            case Section::None:
            default:
                std::cerr << "WARN: Content outside recognized section: " << line << "\n";
                break;
            }
        } catch (const std::exception& e) {
            std::cerr << "ERROR: parse error on line: \"" << line << "\" : " << e.what() << "\n";
            return false;
        }
    }

    if (xi_steps > 0) {
        if (!(g.xi_step > 0.0)) {
            std::cerr << "ERROR: stepping: xi_steps needs xi_step\n";
            return false;
        }
        g.xi_end = g.xi_start - xi_steps * g.xi_step;
    }
    return true;
}


// ------------------------------ Validation ----------------------------------

static void require(bool cond, const std::string& key, const std::string& what) {
    if (!cond) throw ConfigurationError(key + ": " + what);
}

void validate_settings(const Garage& g) {
    require(g.grid_steps >= 7,          "grid.grid_steps", "must be >= 7");
    require(g.grid_steps % 2 == 1,      "grid.grid_steps", "must be odd so a node sits on the axis");
    require(g.grid_step_size > 0.0,     "grid.grid_step_size", "must be > 0");

    require(g.plasma_density >= 0.0,    "plasma.density", "must be >= 0");
    require(g.plasma_density_cm3 >= 0.0, "plasma.density_cm3", "must be >= 0");
    require(g.plasma_coarseness >= 1,   "plasma.coarseness", "must be >= 1");
    require(g.plasma_fineness >= 1,     "plasma.fineness", "must be >= 1");
    require(g.reflect_padding_steps >= 1 && 2 * g.reflect_padding_steps < g.grid_steps,
            "plasma.reflect_padding_steps", "must leave the walls inside the grid");
    require(g.reflect_padding_steps > g.plasma_coarseness + 1,
            "plasma.reflect_padding_steps", "must exceed coarseness + 1 so fine particles stay off the edge cells");
    require(g.plasma_padding_steps >= g.reflect_padding_steps,
            "plasma.padding_steps", "must be >= reflect_padding_steps (plasma starts inside the walls)");
    require(g.grid_steps - 2 * g.plasma_padding_steps >= 2 * g.plasma_coarseness,
            "plasma.padding_steps", "leaves no room for the coarse plasma lattice");
    require(g.channel_depth == 0.0 || g.channel_radius > 0.0, "plasma.channel_radius", "must be > 0");
    parse_boundary_policy(g.plasma_boundary);

    parse_ion_mode(g.ion_mode);
    require(g.ion_charge > 0.0,         "ions.charge", "must be > 0");
    require(g.ion_mass > 0.0,           "ions.mass", "must be > 0");

    require(g.beam_charge != 0.0,       "beam.charge", "must be non-zero");
    require(g.beam_mass > 0.0,          "beam.mass", "must be > 0");
    require(g.beam_density >= 0.0,      "beam.density", "must be >= 0 (the sign comes from beam.charge)");
    require(g.beam_sigma_r > 0.0,       "beam.sigma_r", "must be > 0");
    require(g.beam_sigma_xi > 0.0,      "beam.sigma_xi", "must be > 0");
    require(g.beam_energy_mev >= 0.0,   "beam.energy_mev", "must be >= 0");
    require(g.beam_divergence >= 0.0,   "beam.divergence", "must be >= 0");
    require(g.beam_cut_sigmas > 0.0,    "beam.cut_sigmas", "must be > 0");
    require(g.beam_particles >= 0,      "beam.particles", "must be >= 0");
    require(g.beam_time_step >= 0.0,    "beam.time_step", "must be >= 0");
    for (const auto &p : g.beam_explicit) {
        require(p[6] > 0.0, "beam.particle", "weight must be > 0");
    }

    require(g.xi_step > 0.0,            "stepping.xi_step", "must be > 0");
    require(g.xi_end < g.xi_start,      "stepping.xi_end", "must be below xi_start (xi decreases)");
    require(g.min_xi_step >= 0.0 && g.min_xi_step <= g.xi_step,
            "stepping.min_xi_step", "must be in [0, xi_step]");
    require(g.max_retries >= 0,         "stepping.max_retries", "must be >= 0");

    require(g.subtraction_trick >= 0.0, "solver.subtraction_trick", "must be >= 0");
    require(g.tolerance > 0.0,          "solver.tolerance", "must be > 0");
    require(g.max_iterations >= 1,      "solver.max_iterations", "must be >= 1");
    require(g.min_iterations >= 1 && g.min_iterations <= g.max_iterations,
            "solver.min_iterations", "must be in [1, max_iterations]");
    parse_fine_refresh(g.fine_refresh);
    require(g.charge_tolerance > 0.0,   "solver.charge_tolerance", "must be > 0");

    require(g.diagnostics_each_n_slices >= 0, "diagnostics.each_n_slices", "must be >= 0");
    require(g.checkpoint_each_n_slices >= 0,  "checkpoint.each_n_slices", "must be >= 0");
    require(g.checkpoint_each_n_slices == 0 || !g.checkpoint_path.empty(),
            "checkpoint.path", "is required when checkpoint.each_n_slices > 0");
}


// ------------------------------ HDF5 helpers --------------------------------

static bool h5_ok(herr_t st) { return st >= 0; }

static bool h5_mkgroup(hid_t parent, const char* name) {
    hid_t g = H5Gcreate2(parent, name, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (g < 0) return false;
    return h5_ok(H5Gclose(g));
}

static hid_t h5_open_group(hid_t parent, const char* name) {
    return H5Gopen2(parent, name, H5P_DEFAULT);
}

static hid_t h5_create_group(hid_t parent, const char* name) {
    return H5Gcreate2(parent, name, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
}

// 1D dataset of `n` elements of `type`; empty datasets are created but not written
static bool h5_write_array(hid_t parent, const char* name, hid_t type, const void* buf, size_t n) {
    hsize_t dims[1] = { static_cast<hsize_t>(n) };
    hid_t space = H5Screate_simple(1, dims, nullptr);
    if (space < 0) return false;
    hid_t dset = H5Dcreate2(parent, name, type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0) { H5Sclose(space); return false; }
    bool ok = (n == 0) || h5_ok(H5Dwrite(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf));
    H5Dclose(dset);
    H5Sclose(space);
    return ok;
}

static bool h5_write_scalar_double(hid_t parent, const char* name, double v) {
    return h5_write_array(parent, name, H5T_NATIVE_DOUBLE, &v, 1);
}

static bool h5_write_scalar_int(hid_t parent, const char* name, int v) {
    return h5_write_array(parent, name, H5T_NATIVE_INT, &v, 1);
}

static bool h5_write_scalar_llong(hid_t parent, const char* name, long long v) {
    return h5_write_array(parent, name, H5T_NATIVE_LLONG, &v, 1);
}

static bool h5_write_string(hid_t parent, const char* name, const std::string& s) {
    hid_t type = H5Tcopy(H5T_C_S1);
    if (type < 0) return false;
    if (!h5_ok(H5Tset_size(type, H5T_VARIABLE))) { H5Tclose(type); return false; }

    hid_t space = H5Screate(H5S_SCALAR);
    if (space < 0) { H5Tclose(type); return false; }

    hid_t dset = H5Dcreate2(parent, name, type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0) { H5Sclose(space); H5Tclose(type); return false; }

    const char* ptr = s.c_str();
    bool ok = h5_ok(H5Dwrite(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, &ptr));

    H5Dclose(dset);
    H5Sclose(space);
    H5Tclose(type);
    return ok;
}

static bool h5_write_strvec(hid_t parent, const char* name, const std::vector<std::string>& vec) {
    hsize_t dims[1] = { static_cast<hsize_t>(vec.size()) };
    hid_t space = H5Screate_simple(1, dims, nullptr);
    if (space < 0) return false;

    hid_t type = H5Tcopy(H5T_C_S1);
    if (type < 0) { H5Sclose(space); return false; }
    if (!h5_ok(H5Tset_size(type, H5T_VARIABLE))) { H5Tclose(type); H5Sclose(space); return false; }

    hid_t dset = H5Dcreate2(parent, name, type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0) { H5Tclose(type); H5Sclose(space); return false; }

    std::vector<const char*> cvec; cvec.reserve(vec.size());
    for (auto& s : vec) cvec.push_back(s.c_str());

    bool ok = vec.empty() || h5_ok(H5Dwrite(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, cvec.data()));

    H5Dclose(dset);
    H5Tclose(type);
    H5Sclose(space);
    return ok;
}

static bool h5_write_vec_double(hid_t parent, const char* name, const std::vector<double>& v) {
    return h5_write_array(parent, name, H5T_NATIVE_DOUBLE, v.data(), v.size());
}

static bool h5_write_vec_int(hid_t parent, const char* name, const std::vector<int>& v) {
    return h5_write_array(parent, name, H5T_NATIVE_INT, v.data(), v.size());
}

static bool h5_write_ndarray_counts(hid_t parent, const char* name, const NDArray& arr) {
    std::vector<hsize_t> hd(arr.dims.begin(), arr.dims.end());
    hid_t space = H5Screate_simple(static_cast<int>(hd.size()), hd.data(), nullptr);
    if (space < 0) return false;

    hid_t dset = H5Dcreate2(parent, name, H5T_NATIVE_DOUBLE, space,
                            H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0) { H5Sclose(space); return false; }

    bool ok = h5_ok(H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, arr.data.data()));

    H5Dclose(dset);
    H5Sclose(space);
    return ok;
}

// N x N dataset, x index first
static bool h5_write_field(hid_t parent, const char* name, const Field2D& f) {
    hsize_t dims[2] = { static_cast<hsize_t>(f.n), static_cast<hsize_t>(f.n) };
    hid_t space = H5Screate_simple(2, dims, nullptr);
    if (space < 0) return false;
    hid_t dset = H5Dcreate2(parent, name, H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dset < 0) { H5Sclose(space); return false; }
    bool ok = f.data.empty() || h5_ok(H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, f.data.data()));
    H5Dclose(dset);
    H5Sclose(space);
    return ok;
}

// Reads a whole dataset of any rank into a flat vector
template <typename T>
static bool h5_read_array(hid_t parent, const char* name, hid_t type, std::vector<T>& v) {
    hid_t dset = H5Dopen2(parent, name, H5P_DEFAULT);
    if (dset < 0) return false;
    hid_t space = H5Dget_space(dset);
    if (space < 0) { H5Dclose(dset); return false; }

    const hssize_t n = H5Sget_simple_extent_npoints(space);
    bool ok = (n >= 0);
    if (ok) {
        v.resize(static_cast<size_t>(n));
        if (n > 0) ok = h5_ok(H5Dread(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data()));
    }
    H5Sclose(space);
    H5Dclose(dset);
    return ok;
}

static bool h5_read_scalar_double(hid_t parent, const char* name, double& out) {
    std::vector<double> v;
    if (!h5_read_array(parent, name, H5T_NATIVE_DOUBLE, v) || v.size() != 1) return false;
    out = v[0];
    return true;
}

static bool h5_read_scalar_int(hid_t parent, const char* name, int& out) {
    std::vector<int> v;
    if (!h5_read_array(parent, name, H5T_NATIVE_INT, v) || v.size() != 1) return false;
    out = v[0];
    return true;
}

static bool h5_read_scalar_llong(hid_t parent, const char* name, long long& out) {
    std::vector<long long> v;
    if (!h5_read_array(parent, name, H5T_NATIVE_LLONG, v) || v.size() != 1) return false;
    out = v[0];
    return true;
}

static bool h5_read_field(hid_t parent, const char* name, Field2D& f) {
    std::vector<double> v;
    if (!h5_read_array(parent, name, H5T_NATIVE_DOUBLE, v)) return false;
    const int n = static_cast<int>(std::lround(std::sqrt(static_cast<double>(v.size()))));
    if (static_cast<size_t>(n) * n != v.size()) return false;
    f = Field2D(n);
    f.data = std::move(v);
    return true;
}


// ------------------------- particles and state ------------------------------

static const std::array<std::pair<const char*, double Particle::*>, 9> kParticleColumns = {{
    {"x", &Particle::x}, {"y", &Particle::y}, {"xi", &Particle::xi},
    {"px", &Particle::px}, {"py", &Particle::py}, {"pz", &Particle::pz},
    {"weight", &Particle::weight}, {"x_init", &Particle::x_init}, {"y_init", &Particle::y_init},
}};

static bool h5_write_particles(hid_t parent, const char* name, const std::vector<Particle>& bank) {
    hid_t g = h5_create_group(parent, name);
    if (g < 0) return false;

    const size_t n = bank.size();
    bool ok = true;
    std::vector<double> col(n);
    for (const auto &c : kParticleColumns) {
        for (size_t k = 0; k < n; ++k) col[k] = bank[k].*(c.second);
        ok = ok && h5_write_vec_double(g, c.first, col);
    }

    std::vector<int> species(n), alive(n);
    std::vector<long long> id(n);
    for (size_t k = 0; k < n; ++k) {
        species[k] = static_cast<int>(bank[k].species);
        alive[k]   = bank[k].alive ? 1 : 0;
        id[k]      = static_cast<long long>(bank[k].id);
    }
    ok = ok && h5_write_vec_int(g, "species", species);
    ok = ok && h5_write_vec_int(g, "alive", alive);
    ok = ok && h5_write_array(g, "id", H5T_NATIVE_LLONG, id.data(), id.size());

    H5Gclose(g);
    return ok;
}

static bool h5_read_particles(hid_t parent, const char* name, std::vector<Particle>& bank) {
    hid_t g = h5_open_group(parent, name);
    if (g < 0) return false;

    std::vector<int> species, alive;
    std::vector<long long> id;
    bool ok = h5_read_array(g, "species", H5T_NATIVE_INT, species)
           && h5_read_array(g, "alive", H5T_NATIVE_INT, alive)
           && h5_read_array(g, "id", H5T_NATIVE_LLONG, id)
           && alive.size() == species.size() && id.size() == species.size();

    const size_t n = species.size();
    if (ok) {
        bank.assign(n, Particle{});
        for (size_t k = 0; k < n; ++k) {
            if (species[k] < 0 || species[k] > static_cast<int>(Species::Beam)) { ok = false; break; }
            bank[k].species = static_cast<Species>(species[k]);
            bank[k].alive   = (alive[k] != 0);
            bank[k].id      = static_cast<int64_t>(id[k]);
        }
    }

    std::vector<double> col;
    for (const auto &c : kParticleColumns) {
        if (!ok) break;
        ok = h5_read_array(g, c.first, H5T_NATIVE_DOUBLE, col) && col.size() == n;
        for (size_t k = 0; ok && k < n; ++k) bank[k].*(c.second) = col[k];
    }

    H5Gclose(g);
    return ok;
}

static bool write_population(hid_t parent, const char* name, const PlasmaPopulation& pop) {
    hid_t g = h5_create_group(parent, name);
    if (g < 0) return false;
    bool ok = h5_write_scalar_int(g, "species", static_cast<int>(pop.species));
    ok = ok && h5_write_scalar_int(g, "nc", pop.nc);
    ok = ok && h5_write_particles(g, "coarse", pop.coarse);
    H5Gclose(g);
    return ok;
}

static bool read_population(hid_t parent, const char* name, PlasmaPopulation& pop) {
    hid_t g = h5_open_group(parent, name);
    if (g < 0) return false;
    int species = 0;
    bool ok = h5_read_scalar_int(g, "species", species) && species >= 0 && species <= static_cast<int>(Species::Beam);
    ok = ok && h5_read_scalar_int(g, "nc", pop.nc);
    ok = ok && h5_read_particles(g, "coarse", pop.coarse);
    if (ok) pop.species = static_cast<Species>(species);
    H5Gclose(g);
    return ok;
}

static bool write_state(hid_t root, const SimulationState& s) {
    bool ok = true;
    ok = ok && h5_write_scalar_int   (root, "xi_index",    s.xi_index);
    ok = ok && h5_write_scalar_double(root, "xi",          s.xi);
    ok = ok && h5_write_scalar_double(root, "xi_step",     s.xi_step);
    ok = ok && h5_write_scalar_llong (root, "plasma_lost", static_cast<long long>(s.plasma_lost));

    ok = ok && write_population(root, "electrons", s.electrons);
    ok = ok && write_population(root, "ions", s.ions);

    hid_t g_beam = h5_create_group(root, "beam");
    ok = ok && g_beam >= 0;
    if (g_beam >= 0) {
        ok = ok && h5_write_particles(g_beam, "pending", s.beam.pending);
        ok = ok && h5_write_particles(g_beam, "active",  s.beam.active);
        ok = ok && h5_write_particles(g_beam, "census",  s.beam.census);
        ok = ok && h5_write_scalar_llong(g_beam, "lost", static_cast<long long>(s.beam.lost));
        H5Gclose(g_beam);
    }

    hid_t g_fields = h5_create_group(root, "fields");
    ok = ok && g_fields >= 0;
    if (g_fields >= 0) {
        ok = ok && h5_write_field(g_fields, "Ex", s.fields.Ex);
        ok = ok && h5_write_field(g_fields, "Ey", s.fields.Ey);
        ok = ok && h5_write_field(g_fields, "Ez", s.fields.Ez);
        ok = ok && h5_write_field(g_fields, "Bx", s.fields.Bx);
        ok = ok && h5_write_field(g_fields, "By", s.fields.By);
        ok = ok && h5_write_field(g_fields, "Bz", s.fields.Bz);
        H5Gclose(g_fields);
    }

    hid_t g_src = h5_create_group(root, "sources");
    ok = ok && g_src >= 0;
    if (g_src >= 0) {
        ok = ok && h5_write_field(g_src, "ro", s.sources.ro);
        ok = ok && h5_write_field(g_src, "jx", s.sources.jx);
        ok = ok && h5_write_field(g_src, "jy", s.sources.jy);
        ok = ok && h5_write_field(g_src, "jz", s.sources.jz);
        ok = ok && h5_write_scalar_double(g_src, "particle_charge", s.sources.particle_charge);
        ok = ok && h5_write_scalar_double(g_src, "abs_charge",      s.sources.abs_charge);
        ok = ok && h5_write_scalar_llong (g_src, "skipped", static_cast<long long>(s.sources.skipped));
        H5Gclose(g_src);
    }
    return ok;
}

static bool read_state(hid_t root, SimulationState& s) {
    long long plasma_lost = 0, beam_lost = 0, skipped = 0;
    bool ok = true;
    ok = ok && h5_read_scalar_int   (root, "xi_index",    s.xi_index);
    ok = ok && h5_read_scalar_double(root, "xi",          s.xi);
    ok = ok && h5_read_scalar_double(root, "xi_step",     s.xi_step);
    ok = ok && h5_read_scalar_llong (root, "plasma_lost", plasma_lost);

    ok = ok && read_population(root, "electrons", s.electrons);
    ok = ok && read_population(root, "ions", s.ions);

    if (ok) {
        hid_t g_beam = h5_open_group(root, "beam");
        ok = g_beam >= 0;
        if (ok) {
            ok = ok && h5_read_particles(g_beam, "pending", s.beam.pending);
            ok = ok && h5_read_particles(g_beam, "active",  s.beam.active);
            ok = ok && h5_read_particles(g_beam, "census",  s.beam.census);
            ok = ok && h5_read_scalar_llong(g_beam, "lost", beam_lost);
            H5Gclose(g_beam);
        }
    }

    if (ok) {
        hid_t g_fields = h5_open_group(root, "fields");
        ok = g_fields >= 0;
        if (ok) {
            ok = ok && h5_read_field(g_fields, "Ex", s.fields.Ex);
            ok = ok && h5_read_field(g_fields, "Ey", s.fields.Ey);
            ok = ok && h5_read_field(g_fields, "Ez", s.fields.Ez);
            ok = ok && h5_read_field(g_fields, "Bx", s.fields.Bx);
            ok = ok && h5_read_field(g_fields, "By", s.fields.By);
            ok = ok && h5_read_field(g_fields, "Bz", s.fields.Bz);
            H5Gclose(g_fields);
        }
    }

    if (ok) {
        hid_t g_src = h5_open_group(root, "sources");
        ok = g_src >= 0;
        if (ok) {
            ok = ok && h5_read_field(g_src, "ro", s.sources.ro);
            ok = ok && h5_read_field(g_src, "jx", s.sources.jx);
            ok = ok && h5_read_field(g_src, "jy", s.sources.jy);
            ok = ok && h5_read_field(g_src, "jz", s.sources.jz);
            ok = ok && h5_read_scalar_double(g_src, "particle_charge", s.sources.particle_charge);
            ok = ok && h5_read_scalar_double(g_src, "abs_charge",      s.sources.abs_charge);
            ok = ok && h5_read_scalar_llong (g_src, "skipped", skipped);
            H5Gclose(g_src);
        }
    }

    s.plasma_lost     = static_cast<int64_t>(plasma_lost);
    s.beam.lost       = static_cast<int64_t>(beam_lost);
    s.sources.skipped = static_cast<int64_t>(skipped);
    return ok;
}


// ----------------------------- Checkpoints ----------------------------------

static void remove_partial(const std::filesystem::path& tmp) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    if (ec) std::cerr << "WARN: Could not remove partial checkpoint " << tmp << " : " << ec.message() << "\n";
}

bool write_checkpoint(const std::filesystem::path& path, const SimulationState& s) {
    // write next to the target and rename, so a crash never leaves a torn checkpoint
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    hid_t file = H5Fcreate(tmp.string().c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file < 0) {
        std::cerr << "ERROR: Failed to create checkpoint file: " << tmp << "\n";
        return false;
    }

    bool ok = h5_write_string(file, "format", "qswake-checkpoint-1");
    ok = ok && write_state(file, s);

    if (!h5_ok(H5Fclose(file)) || !ok) {
        std::cerr << "ERROR: Failed writing checkpoint: " << tmp << "\n";
        remove_partial(tmp);
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "ERROR: Failed to move checkpoint into place: " << path << " : " << ec.message() << "\n";
        remove_partial(tmp);
        return false;
    }
    return true;
}

bool read_checkpoint(const std::filesystem::path& path, SimulationState& s) {
    hid_t file = H5Fopen(path.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file < 0) {
        std::cerr << "ERROR: Cannot open checkpoint file: " << path << "\n";
        return false;
    }

    const bool ok = read_state(file, s);
    H5Fclose(file);
    if (!ok) {
        std::cerr << "ERROR: Checkpoint is incomplete or malformed: " << path << "\n";
        return false;
    }
    return true;
}


// ------------------------------ Output writer -------------------------------

static bool write_tally_block(hid_t parent_group, const std::vector<Tally>& tallies) {
    bool ok_local = true;

    for (const Tally& t : tallies) {
        hid_t g_one = h5_create_group(parent_group, t.tally_name.c_str());
        if (g_one < 0) return false;

        ok_local = ok_local && h5_write_string(g_one, "tally_name", t.tally_name);
        ok_local = ok_local && h5_write_strvec(g_one, "species",    t.species);

        std::vector<std::string> names;
        names.reserve(t.dims.size());
        for (const auto &d : t.dims) names.push_back(d.name);
        ok_local = ok_local && h5_write_strvec(g_one, "dim_names", names);
        for (const auto &d : t.dims) {
            std::string dset_name = d.name + "_edges";
            ok_local = ok_local && h5_write_vec_double(g_one, dset_name.c_str(), d.edges);
        }

        // shape {S, dim0_bins, dim1_bins, ...}
        ok_local = ok_local && h5_write_ndarray_counts(g_one, "counts", t.counts);

        H5Gclose(g_one);
        if (!ok_local) break;
    }

    return ok_local;
}

static bool write_settings(hid_t g_input, const Garage& g) {
    bool ok = true;

    hid_t s = h5_create_group(g_input, "grid");
    ok = ok && h5_write_scalar_int   (s, "grid_steps",     g.grid_steps);
    ok = ok && h5_write_scalar_double(s, "grid_step_size", g.grid_step_size);
    H5Gclose(s);

    s = h5_create_group(g_input, "plasma");
    ok = ok && h5_write_scalar_double(s, "density",               g.plasma_density);
    ok = ok && h5_write_scalar_double(s, "density_cm3",           g.plasma_density_cm3);
    ok = ok && h5_write_scalar_int   (s, "coarseness",            g.plasma_coarseness);
    ok = ok && h5_write_scalar_int   (s, "fineness",              g.plasma_fineness);
    ok = ok && h5_write_scalar_int   (s, "padding_steps",         g.plasma_padding_steps);
    ok = ok && h5_write_scalar_int   (s, "reflect_padding_steps", g.reflect_padding_steps);
    ok = ok && h5_write_string       (s, "boundary",              g.plasma_boundary);
    ok = ok && h5_write_scalar_double(s, "channel_depth",         g.channel_depth);
    ok = ok && h5_write_scalar_double(s, "channel_radius",        g.channel_radius);
    H5Gclose(s);

    s = h5_create_group(g_input, "ions");
    ok = ok && h5_write_string       (s, "mode",   g.ion_mode);
    ok = ok && h5_write_scalar_double(s, "charge", g.ion_charge);
    ok = ok && h5_write_scalar_double(s, "mass",   g.ion_mass);
    H5Gclose(s);

    s = h5_create_group(g_input, "beam");
    ok = ok && h5_write_scalar_double(s, "charge",     g.beam_charge);
    ok = ok && h5_write_scalar_double(s, "mass",       g.beam_mass);
    ok = ok && h5_write_scalar_double(s, "density",    g.beam_density);
    ok = ok && h5_write_scalar_double(s, "sigma_r",    g.beam_sigma_r);
    ok = ok && h5_write_scalar_double(s, "sigma_xi",   g.beam_sigma_xi);
    ok = ok && h5_write_scalar_double(s, "xi_center",  g.beam_xi_center);
    ok = ok && h5_write_scalar_double(s, "energy_mev", g.beam_energy_mev);
    ok = ok && h5_write_scalar_double(s, "pz",         g.beam_pz);
    ok = ok && h5_write_scalar_double(s, "divergence", g.beam_divergence);
    ok = ok && h5_write_scalar_double(s, "cut_sigmas", g.beam_cut_sigmas);
    ok = ok && h5_write_scalar_int   (s, "particles",  g.beam_particles);
    ok = ok && h5_write_scalar_llong (s, "seed",       static_cast<long long>(g.beam_seed));
    ok = ok && h5_write_scalar_double(s, "time_step",  g.beam_time_step);
    ok = ok && h5_write_scalar_int   (s, "explicit_particles", static_cast<int>(g.beam_explicit.size()));
    H5Gclose(s);

    s = h5_create_group(g_input, "stepping");
    ok = ok && h5_write_scalar_double(s, "xi_start",    g.xi_start);
    ok = ok && h5_write_scalar_double(s, "xi_end",      g.xi_end);
    ok = ok && h5_write_scalar_double(s, "xi_step",     g.xi_step);
    ok = ok && h5_write_scalar_double(s, "min_xi_step", g.min_xi_step);
    ok = ok && h5_write_scalar_int   (s, "max_retries", g.max_retries);
    H5Gclose(s);

    s = h5_create_group(g_input, "solver");
    ok = ok && h5_write_scalar_double(s, "subtraction_trick", g.subtraction_trick);
    ok = ok && h5_write_scalar_double(s, "tolerance",         g.tolerance);
    ok = ok && h5_write_scalar_int   (s, "max_iterations",    g.max_iterations);
    ok = ok && h5_write_scalar_int   (s, "min_iterations",    g.min_iterations);
    ok = ok && h5_write_string       (s, "fine_refresh",      g.fine_refresh);
    ok = ok && h5_write_scalar_double(s, "charge_tolerance",  g.charge_tolerance);
    H5Gclose(s);

    return ok;
}

bool create_output(const std::filesystem::path& out) {
    hid_t file = H5Fcreate(out.string().c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file < 0) {
        std::cerr << "ERROR: Failed to create HDF5 file: " << out << "\n";
        return false;
    }
    bool ok = h5_mkgroup(file, "/snapshots");
    if (!h5_ok(H5Fclose(file)) || !ok) {
        std::cerr << "ERROR: Failed to initialise HDF5 file: " << out << "\n";
        return false;
    }
    return true;
}

bool write_snapshot(const std::filesystem::path& out, const SimulationState& s) {
    hid_t file = H5Fopen(out.string().c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
    if (file < 0) {
        std::cerr << "ERROR: Cannot open output file for snapshot: " << out << "\n";
        return false;
    }

    bool ok = false;
    hid_t g_snaps = h5_open_group(file, "/snapshots");
    if (g_snaps >= 0) {
        const std::string name = "slice_" + std::to_string(s.xi_index);
        hid_t g_one = h5_create_group(g_snaps, name.c_str());
        if (g_one >= 0) {
            ok = write_state(g_one, s);
            H5Gclose(g_one);
        }
        H5Gclose(g_snaps);
    }

    if (!h5_ok(H5Fclose(file)) || !ok) {
        std::cerr << "ERROR: Failed writing snapshot of slice " << s.xi_index << " to: " << out << "\n";
        return false;
    }
    return true;
}

bool write_output(const std::filesystem::path& out, const XiStepper& stepper,
                  const Diagnostics& diags, double sim_s, double total_s) {
    hid_t file = H5Fopen(out.string().c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
    if (file < 0) {
        std::cerr << "ERROR: Cannot open HDF5 file: " << out << "\n";
        return false;
    }

    bool ok = true;
    const Garage &g = stepper.settings();
    const SimulationState &s = stepper.state();

    // Top-level groups
    ok = ok && h5_mkgroup(file, "/input");
    ok = ok && h5_mkgroup(file, "/details");
    ok = ok && h5_mkgroup(file, "/diagnostics");
    if (!ok) {
        std::cerr << "ERROR: Failed to create top-level groups.\n";
        H5Fclose(file);
        return false;
    }

    // ----- details -----
    {
        hid_t d = h5_open_group(file, "/details");
        ok = ok && h5_write_scalar_double(d, "simulation_time", sim_s);
        ok = ok && h5_write_scalar_double(d, "total_time",      total_s);
        ok = ok && h5_write_scalar_int   (d, "slices",          s.xi_index);
        ok = ok && h5_write_scalar_double(d, "xi",              s.xi);
        ok = ok && h5_write_scalar_int   (d, "retries",         stepper.retries());
        ok = ok && h5_write_scalar_llong (d, "plasma_lost",     static_cast<long long>(s.plasma_lost));
        ok = ok && h5_write_scalar_llong (d, "beam_lost",       static_cast<long long>(s.beam.lost));
        ok = ok && h5_write_scalar_llong (d, "beam_census",     static_cast<long long>(s.beam.census.size()));

        const PlasmaScales sc = plasma_scales(g.plasma_density_cm3);
        ok = ok && h5_write_scalar_double(d, "omega_p",    sc.omega_p);
        ok = ok && h5_write_scalar_double(d, "skin_depth", sc.skin_depth);
        ok = ok && h5_write_scalar_double(d, "e0_field",   sc.e0_field);
        H5Gclose(d);
    }

    // ----- input echo -----
    {
        hid_t g_input = h5_open_group(file, "/input");
        ok = ok && write_settings(g_input, g);
        H5Gclose(g_input);
    }

    // ----- diagnostics -----
    {
        hid_t d = h5_open_group(file, "/diagnostics");
        ok = ok && h5_write_vec_double   (d, "xi",     diags.xi_history());
        ok = ok && h5_write_vec_double   (d, "Ez_00",  diags.ez_00_history());
        ok = ok && h5_write_scalar_double(d, "max_zn", diags.max_zn());

        hid_t g_tallies = h5_create_group(d, "tallies");
        ok = ok && g_tallies >= 0 && write_tally_block(g_tallies, {diags.beam_spectrum()});
        if (g_tallies >= 0) H5Gclose(g_tallies);
        H5Gclose(d);
    }

    // Close file
    if (!h5_ok(H5Fclose(file))) {
        std::cerr << "ERROR: Failed to close HDF5 file: " << out << "\n";
        return false;
    }
    if (!ok) {
        std::cerr << "ERROR: Failed writing one or more datasets/groups to: " << out << "\n";
        return false;
    }
    return true;
}
