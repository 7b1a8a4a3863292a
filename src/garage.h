#pragma once
#include <string>
#include <vector>
#include <array>
#include <cstdint>

// Run configuration, filled by parse_input_file() and checked by
// validate_settings(). Read-only once the run is initialized.
struct Garage {

    // ---- grid ----
    int    grid_steps     = 0;    // nodes per axis, odd
    double grid_step_size = 0.0;  // h [c/omega_p]

    // ---- plasma ----
    double plasma_density        = 1.0;  // n0 [n0], scales the whole profile
    double plasma_density_cm3    = 0.0;  // optional, only for unit reporting
    int    plasma_coarseness     = 2;    // coarse particle spacing in cells
    int    plasma_fineness       = 2;    // fine particles per cell per axis
    int    plasma_padding_steps  = 10;   // plasma placement <-> grid edge
    int    reflect_padding_steps = 5;    // reflection wall <-> grid edge
    std::string plasma_boundary  = "reflect"; // reflect | remove
    double channel_depth         = 0.0;  // n(r) = n0 (1 + depth r^2/R^2)
    double channel_radius        = 1.0;

    // ---- background ions ----
    std::string ion_mode = "immobile";   // immobile | mobile
    double ion_charge    = 1.0;          // Z
    double ion_mass      = 1836.152673;  // [m_e]

    // ---- beam ----
    double beam_charge     = -1.0;       // species charge sign
    double beam_mass       = 1.0;        // [m_e]
    double beam_density    = 0.0;        // peak |n_b| / n0, 0 disables the bunch
    double beam_sigma_r    = 1.0;
    double beam_sigma_xi   = 1.0;
    double beam_xi_center  = -3.0;
    double beam_energy_mev = 0.0;        // 0 means use beam_pz
    double beam_pz         = 1000.0;
    double beam_divergence = 0.0;        // rms px/pz
    double beam_cut_sigmas = 3.0;
    int    beam_particles  = 0;
    uint64_t beam_seed     = 123456789u;
    double beam_time_step  = 0.0;        // 0 leaves the beam momenta untouched
    // explicit particles: x y xi px py pz weight
    std::vector<std::array<double,7>> beam_explicit;

    // ---- stepping ----
    double xi_start    = 0.0;
    double xi_end      = 0.0;
    double xi_step     = 0.0;
    double min_xi_step = 0.0;  // 0 -> xi_step / 16
    int    max_retries = 3;

    // ---- solver ----
    double subtraction_trick = 1.0;
    double tolerance         = 1e-6;
    int    max_iterations    = 8;
    int    min_iterations    = 2;
    std::string fine_refresh = "per_iteration"; // per_iteration | per_slice
    double charge_tolerance  = 1e-10;

    // ---- diagnostics / checkpoints ----
    int  diagnostics_each_n_slices = 0;  // 0 -> last slice only
    bool diagnostics_snapshots     = false;
    bool quiet                     = false;
    int  checkpoint_each_n_slices  = 0;  // 0 -> no periodic checkpoints
    std::string checkpoint_path;

    // derived: total number of nominal slices
    int xi_steps() const {
        if (xi_step <= 0.0) return 0;
        return static_cast<int>((xi_start - xi_end) / xi_step + 0.5);
    }
};
