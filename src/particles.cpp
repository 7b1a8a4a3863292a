#include "particles.h"
#include "utilities.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>


SpeciesTable make_species_table(const Garage& g) {
    SpeciesTable t;
    t.traits[static_cast<int>(Species::PlasmaElectron)] = {"plasma_electron", -1.0, 1.0, DepositKind::Plasma};
    t.traits[static_cast<int>(Species::PlasmaIon)]      = {"plasma_ion", g.ion_charge, g.ion_mass, DepositKind::Plasma};
    t.traits[static_cast<int>(Species::Beam)]           = {"beam", g.beam_charge, g.beam_mass, DepositKind::Beam};
    return t;
}


size_t PlasmaPopulation::live_count() const {
    size_t n = 0;
    for (const auto &p : coarse) {
        if (p.alive) ++n;
    }
    return n;
}


// ---------------------------- lattices ---------------------------------------

std::vector<double> make_coarse_plasma_grid(int steps, double step_size, int coarseness) {
    const double plasma_step = step_size * coarseness;
    const int half = steps / (coarseness * 2);
    if (half < 1) throw std::invalid_argument("make_coarse_plasma_grid: plasma region too small for coarseness.");

    // symmetric around 0: -(half-1) .. (half-1)
    std::vector<double> grid;
    grid.reserve(2 * half - 1);
    for (int i = half - 1; i > 0; --i) grid.push_back(-i * plasma_step);
    for (int i = 0; i < half; ++i) grid.push_back(i * plasma_step);
    return grid;
}

std::vector<double> make_fine_plasma_grid(int steps, double step_size, int fineness) {
    const double plasma_step = step_size / fineness;
    const int half = steps / 2 * fineness;
    std::vector<double> grid;

    if (fineness % 2) {
        // some on zero axes, none on cell corners
        grid.reserve(2 * half - 1);
        for (int i = half - 1; i > 0; --i) grid.push_back(-i * plasma_step);
        for (int i = 0; i < half; ++i) grid.push_back(i * plasma_step);
    } else {
        // none on zero axes, none on cell corners
        grid.reserve(2 * half);
        for (int i = half - 1; i >= 0; --i) grid.push_back(-(0.5 + i) * plasma_step);
        for (int i = 0; i < half; ++i) grid.push_back((0.5 + i) * plasma_step);
    }
    return grid;
}

FineLayout make_fine_layout(const Garage& g) {
    const int plasma_steps = g.grid_steps - 2 * g.plasma_padding_steps;

    FineLayout L;
    L.coarse_grid = make_coarse_plasma_grid(plasma_steps, g.grid_step_size, g.plasma_coarseness);
    L.fine_grid   = make_fine_plasma_grid(plasma_steps, g.grid_step_size, g.plasma_fineness);
    L.nc = static_cast<int>(L.coarse_grid.size());
    L.nf = static_cast<int>(L.fine_grid.size());
    L.coarse_step = g.grid_step_size * g.plasma_coarseness;
    const double cf = static_cast<double>(g.plasma_coarseness) * g.plasma_fineness;
    L.smallness = 1.0 / (cf * cf);

    L.indices_prev.resize(L.nf);
    L.indices_next.resize(L.nf);
    L.influence_prev.resize(L.nf);
    L.influence_next.resize(L.nf);

    const double first = L.coarse_grid.front();
    const double last  = L.coarse_grid.back();
    for (int k = 0; k < L.nf; ++k) {
        const double f = L.fine_grid[k];
        // first coarse node >= f
        const int idx = static_cast<int>(std::lower_bound(L.coarse_grid.begin(), L.coarse_grid.end(), f)
                                         - L.coarse_grid.begin());
        const int next = std::clamp(idx, 0, L.nc - 1);
        const int prev = std::clamp(idx - 1, 0, L.nc - 1);
        L.indices_next[k] = next;
        L.indices_prev[k] = prev;

        // the further from the next coarse node, the more the previous one counts
        double w_prev = (L.coarse_grid[next] - f) / L.coarse_step;
        double w_next = (f - L.coarse_grid[prev]) / L.coarse_step;
        if (f <= first) { w_prev = 0.0; w_next = 1.0; }  // nothing on the left
        if (f >= last)  { w_next = 0.0; w_prev = 1.0; }  // nothing on the right
        L.influence_prev[k] = w_prev;
        L.influence_next[k] = w_next;
    }
    return L;
}


double plasma_density_at(const Garage& g, double x, double y) {
    double n = g.plasma_density;
    if (g.channel_depth != 0.0) {
        const double r2 = x * x + y * y;
        n *= 1.0 + g.channel_depth * r2 / (g.channel_radius * g.channel_radius);
    }
    return std::max(n, 0.0);
}

PlasmaPopulation make_plasma(const Garage& g, const FineLayout& layout,
                             Species species, double charge_number) {
    PlasmaPopulation pop;
    pop.species = species;
    pop.nc = layout.nc;
    pop.coarse.resize(static_cast<size_t>(layout.nc) * layout.nc);

    const double area = layout.coarse_step * layout.coarse_step;
    for (int a = 0; a < layout.nc; ++a) {
        for (int b = 0; b < layout.nc; ++b) {
            Particle &p = pop.coarse[static_cast<size_t>(a) * layout.nc + b];
            p.species = species;
            p.x_init = p.x = layout.coarse_grid[a];
            p.y_init = p.y = layout.coarse_grid[b];
            p.weight = plasma_density_at(g, p.x, p.y) * area / charge_number;
            p.id = static_cast<int64_t>(a) * layout.nc + b;
        }
    }
    return pop;
}


std::vector<Particle> refine(const PlasmaPopulation& pop, const FineLayout& layout) {
    std::vector<Particle> fine;
    fine.reserve(static_cast<size_t>(layout.nf) * layout.nf);

    const int nc = pop.nc;
    for (int pi = 0; pi < layout.nf; ++pi) {
        for (int pj = 0; pj < layout.nf; ++pj) {
            const int ix[2] = {layout.indices_prev[pi], layout.indices_next[pi]};
            const int iy[2] = {layout.indices_prev[pj], layout.indices_next[pj]};
            const double wx[2] = {layout.influence_prev[pi], layout.influence_next[pi]};
            const double wy[2] = {layout.influence_prev[pj], layout.influence_next[pj]};

            //  C    D  #  y ^
            //     .    #    |
            //  A    B  #    +---> x
            double w_sum = 0.0;
            double x_offt = 0.0, y_offt = 0.0;
            double px = 0.0, py = 0.0, pz = 0.0, weight = 0.0;
            bool all_alive = true;
            for (int b = 0; b < 2; ++b) {
                for (int a = 0; a < 2; ++a) {
                    const double w = wx[a] * wy[b];
                    const Particle &c = pop.coarse[static_cast<size_t>(ix[a]) * nc + iy[b]];
                    if (!c.alive) {
                        if (w > 0.0) all_alive = false;
                        continue;
                    }
                    w_sum  += w;
                    x_offt += w * (c.x - c.x_init);
                    y_offt += w * (c.y - c.y_init);
                    px     += w * c.px;
                    py     += w * c.py;
                    pz     += w * c.pz;
                    weight += w * c.weight;
                }
            }
            if (!(w_sum > 0.0)) continue;  // every contributing corner is gone
            if (!all_alive) {
                x_offt /= w_sum; y_offt /= w_sum;
                px /= w_sum; py /= w_sum; pz /= w_sum;
                weight /= w_sum;
            }

            Particle f;
            f.species = pop.species;
            f.x_init = layout.fine_grid[pi];
            f.y_init = layout.fine_grid[pj];
            f.x  = f.x_init + x_offt;
            f.y  = f.y_init + y_offt;
            f.px = px;
            f.py = py;
            f.pz = pz;
            f.weight = weight * layout.smallness;
            f.id = static_cast<int64_t>(pi) * layout.nf + pj;
            fine.push_back(f);
        }
    }
    return fine;
}


// ------------------------------- beam ----------------------------------------

static double gaussian_bunch_population(const Garage& g) {
    // integral of the peak-normalised Gaussian inside the cut, in n0 (c/omega_p)^3
    const double cut = g.beam_cut_sigmas;
    const double transverse   = 2.0 * M_PI * g.beam_sigma_r * g.beam_sigma_r * (1.0 - std::exp(-0.5 * cut * cut));
    const double longitudinal = std::sqrt(2.0 * M_PI) * g.beam_sigma_xi * std::erf(cut / std::sqrt(2.0));
    return g.beam_density * transverse * longitudinal;
}

BeamState make_beam(const Garage& g, const Grid& grid) {
    BeamState beam;
    std::vector<Particle> all;

    if (g.beam_density > 0.0 && g.beam_particles > 0) {
        const double pz0 = (g.beam_energy_mev > 0.0)
                         ? kinetic_energy_2_pz(g.beam_energy_mev, g.beam_mass)
                         : g.beam_pz;
        const double cut = g.beam_cut_sigmas;
        const double w = gaussian_bunch_population(g) / g.beam_particles;

        R123Rng base(g.beam_seed);
        all.reserve(static_cast<size_t>(g.beam_particles));
        for (int k = 0; k < g.beam_particles; ++k) {
            // one counter stream per particle: independent of sampling order
            R123Rng rng = base.fork(static_cast<uint64_t>(k));

            double x, y;
            do {
                x = g.beam_sigma_r * rng.normal();
                y = g.beam_sigma_r * rng.normal();
            } while (x * x + y * y > cut * cut * g.beam_sigma_r * g.beam_sigma_r);
            double d;
            do {
                d = rng.normal();
            } while (std::abs(d) > cut);

            Particle p;
            p.species = Species::Beam;
            p.x  = x;
            p.y  = y;
            p.xi = g.beam_xi_center + g.beam_sigma_xi * d;
            p.pz = pz0;
            if (g.beam_divergence > 0.0) {
                p.px = pz0 * g.beam_divergence * rng.normal();
                p.py = pz0 * g.beam_divergence * rng.normal();
            }
            p.weight = w;
            p.id = k;
            all.push_back(p);
        }
    }

    int64_t next_id = static_cast<int64_t>(all.size());
    for (const auto &e : g.beam_explicit) {
        Particle p;
        p.species = Species::Beam;
        p.x  = e[0]; p.y  = e[1]; p.xi = e[2];
        p.px = e[3]; p.py = e[4]; p.pz = e[5];
        p.weight = e[6];
        p.id = next_id++;
        all.push_back(p);
    }

    for (auto &p : all) {
        if (p.xi > g.xi_start || p.xi < g.xi_end || !grid.contains(p.x, p.y)) {
            beam.lost++;
            continue;
        }
        beam.pending.push_back(p);
    }
    if (beam.lost > 0) {
        std::cerr << "WARN: " << beam.lost << " beam particles start outside the simulation window and were dropped\n";
    }

    std::stable_sort(beam.pending.begin(), beam.pending.end(),
                     [](const Particle& a, const Particle& b) { return a.xi < b.xi; });
    return beam;
}

void take_slice_layer(BeamState& beam, double xi_lo) {
    // Take from the back for O(1) remove
    while (!beam.pending.empty() && beam.pending.back().xi > xi_lo) {
        beam.active.push_back(std::move(beam.pending.back()));
        beam.pending.pop_back();
    }
}
