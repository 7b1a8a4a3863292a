#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "garage.h"
#include "grid.h"

// ---------- species ----------
enum class Species : int { PlasmaElectron = 0, PlasmaIon = 1, Beam = 2 };

enum class DepositKind { Plasma, Beam };

struct SpeciesTraits {
    std::string label;
    double      charge = 0.0;   // [e]
    double      mass   = 1.0;   // [m_e]
    DepositKind deposit = DepositKind::Plasma;
};

// Dispatch table indexed by Species
class SpeciesTable {
public:
    std::array<SpeciesTraits,3> traits;

    const SpeciesTraits& operator[](Species s) const { return traits[static_cast<int>(s)]; }
};

SpeciesTable make_species_table(const Garage& g);


// ---------- particle ----------
class Particle {
public:
    Species species = Species::PlasmaElectron;

    double x  = 0.0; // [c/omega_p]
    double y  = 0.0;
    double xi = 0.0; // beam only

    // momentum per physical particle [m_e c]
    double px = 0.0;
    double py = 0.0;
    double pz = 0.0;

    double weight = 0.0; // physical particles represented

    // lattice position the particle was born at (plasma only)
    double x_init = 0.0;
    double y_init = 0.0;

    bool    alive = true;
    int64_t id    = -1;

    Particle() = default;
};


// ---------- plasma ----------
// Coarse particles form an nc x nc lattice, index a*nc + b (a along x, b along y).
struct PlasmaPopulation {
    Species species = Species::PlasmaElectron;
    int nc = 0;
    // The only persisted plasma state. The fine sample is derived from it
    // inside each slice solve and never stored.
    std::vector<Particle> coarse;

    size_t live_count() const;
};

// Coarse -> fine bilinear interpolation pattern, built once from the two lattices.
struct FineLayout {
    int    nc = 0;
    int    nf = 0;
    double coarse_step = 0.0;
    double smallness   = 1.0;          // 1 / (coarseness * fineness)^2
    std::vector<double> coarse_grid;   // 1D coarse lattice (nc)
    std::vector<double> fine_grid;     // 1D fine lattice (nf)
    std::vector<int>    indices_prev;  // nearest coarse node at or below, per fine node
    std::vector<int>    indices_next;
    std::vector<double> influence_prev;
    std::vector<double> influence_next;
};

std::vector<double> make_coarse_plasma_grid(int steps, double step_size, int coarseness);
std::vector<double> make_fine_plasma_grid(int steps, double step_size, int fineness);

FineLayout make_fine_layout(const Garage& g);

// Transverse plasma density n(x, y) in units of n0
double plasma_density_at(const Garage& g, double x, double y);

// Cold coarse plasma at rest on the coarse lattice.
// weight = n(x,y) * (coarse step)^2 / charge_number
PlasmaPopulation make_plasma(const Garage& g, const FineLayout& layout,
                             Species species, double charge_number = 1.0);

// Pure coarse -> fine refinement. Dead coarse particles are skipped and the
// remaining corner weights renormalised.
std::vector<Particle> refine(const PlasmaPopulation& pop, const FineLayout& layout);


// ---------- beam ----------
struct BeamState {
    std::vector<Particle> pending;  // not reached yet, sorted by ascending xi (back = leading)
    std::vector<Particle> active;   // layer of the current slice
    std::vector<Particle> census;   // already advanced
    int64_t lost = 0;

    size_t total_count() const { return pending.size() + active.size() + census.size(); }
};

// Initial beam from configuration: Gaussian bunch plus any explicit particles.
BeamState make_beam(const Garage& g, const Grid& grid);

// Move every pending particle with xi > xi_lo into the active bank.
void take_slice_layer(BeamState& beam, double xi_lo);
