#pragma once
#include <cstdint>
#include <vector>

#include "grid.h"
#include "particles.h"
#include "utilities.h"

// Charge and current densities of one slice, plus the particle-side totals
// used to verify that deposition conserved charge.
struct SourceTerms {
    Field2D ro;
    Field2D jx;
    Field2D jy;
    Field2D jz;

    double  particle_charge = 0.0;  // sum of the deposited particle charges
    double  abs_charge      = 0.0;  // sum of their magnitudes
    int64_t skipped         = 0;    // particles outside the grid, not deposited

    SourceTerms() = default;
    explicit SourceTerms(int n) : ro(n), jx(n), jy(n), jz(n) {}
};

// Deposit particles onto a fresh set of source arrays. Plasma species deposit
// q w / (1 - v_z) and the matching currents; beam species deposit q w / xi_step
// into ro and jz. Particle state is not modified.
SourceTerms deposit(const std::vector<Particle>& particles, const Grid& grid,
                    const SpeciesTable& table, double xi_step = 0.0);

// out += in, totals included
void accumulate(SourceTerms& out, const SourceTerms& in);

// Throws InvalidSourceTermsError when the grid charge and the particle charge
// differ by more than `tolerance` relative to the total charge magnitude.
void check_charge_conservation(const SourceTerms& src, const Grid& grid,
                               double tolerance, int slice);
