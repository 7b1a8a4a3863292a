#pragma once
#include "garage.h"

// Small uniform plasma on a 41 x 41 grid, no beam, four slices.
inline Garage small_plasma_config() {
    Garage g;
    g.grid_steps            = 41;
    g.grid_step_size        = 0.1;
    g.plasma_coarseness     = 2;
    g.plasma_fineness       = 2;
    g.plasma_padding_steps  = 8;
    g.reflect_padding_steps = 4;

    g.xi_start = 0.0;
    g.xi_end   = -0.4;
    g.xi_step  = 0.1;

    g.tolerance      = 1e-6;
    g.max_iterations = 20;
    g.min_iterations = 2;
    return g;
}

// Same plasma with a weak positively charged Gaussian bunch entering after
// the first slice.
inline Garage small_beam_config() {
    Garage g = small_plasma_config();
    g.beam_charge     = 1.0;
    g.beam_density    = 0.05;
    g.beam_sigma_r    = 0.3;
    g.beam_sigma_xi   = 0.25;
    g.beam_xi_center  = -0.9;
    g.beam_pz         = 1000.0;
    g.beam_particles  = 4000;
    g.beam_seed       = 20240611u;
    g.xi_end          = -1.0;
    return g;
}
