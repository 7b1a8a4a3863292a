#include "loop.h"
#include "errors.h"
#include "io.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>


FineRefresh parse_fine_refresh(const std::string& name) {
    if (name == "per_iteration") return FineRefresh::PerIteration;
    if (name == "per_slice")     return FineRefresh::PerSlice;
    throw ConfigurationError("solver.fine_refresh: expected 'per_iteration' or 'per_slice', got '" + name + "'");
}

static const Garage& validated(const Garage& g) {
    validate_settings(g);
    return g;
}

// Fine sample of a population; an empty population has none.
static std::vector<Particle> fine_sample(const PlasmaPopulation& pop, const FineLayout& layout) {
    if (pop.coarse.empty()) return {};
    return refine(pop, layout);
}

static int64_t count_removed(const PlasmaPopulation& before, const PlasmaPopulation& after) {
    int64_t n = 0;
    for (size_t k = 0; k < before.coarse.size() && k < after.coarse.size(); ++k) {
        if (before.coarse[k].alive && !after.coarse[k].alive) ++n;
    }
    return n;
}


XiStepper::XiStepper(const Garage& g)
    : g_(validated(g)),
      grid_(g_.grid_steps, g_.grid_step_size),
      table_(make_species_table(g_)),
      layout_(make_fine_layout(g_)),
      solver_(grid_, g_.subtraction_trick),
      pusher_(grid_, table_, parse_boundary_policy(g_.plasma_boundary), reflect_wall(g_)),
      advancer_(grid_, table_, g_.beam_time_step),
      ion_mode_(parse_ion_mode(g_.ion_mode)),
      refresh_(parse_fine_refresh(g_.fine_refresh)),
      min_step_(g_.min_xi_step > 0.0 ? g_.min_xi_step : g_.xi_step / 16.0) {

    state_.xi_index = 0;
    state_.xi       = g_.xi_start;
    state_.xi_step  = g_.xi_step;

    state_.electrons = make_plasma(g_, layout_, Species::PlasmaElectron);
    if (ion_mode_ == IonMode::Mobile) {
        state_.ions = make_plasma(g_, layout_, Species::PlasmaIon, g_.ion_charge);
        background_ = BackgroundIons::mobile(grid_);
    } else {
        state_.ions.species = Species::PlasmaIon;
        state_.ions.nc = layout_.nc;
        const SourceTerms initial_electrons = deposit(fine_sample(state_.electrons, layout_), grid_, table_);
        background_ = BackgroundIons::immobile(initial_electrons);
    }

    state_.beam   = make_beam(g_, grid_);
    state_.fields = FieldSet(grid_.steps());
    state_.sources = deposit_plasma(fine_sample(state_.electrons, layout_),
                                    fine_sample(state_.ions, layout_));
    check_charge_conservation(state_.sources, grid_, g_.charge_tolerance, 0);
}

void XiStepper::restore(SimulationState state) {
    const int n = grid_.steps();
    if (state.fields.Ex.n != n || state.sources.ro.n != n) {
        throw ConfigurationError("restored state has a " + std::to_string(state.fields.Ex.n)
                                 + "-node grid, configuration has " + std::to_string(n));
    }
    const size_t coarse = static_cast<size_t>(layout_.nc) * layout_.nc;
    if (state.electrons.coarse.size() != coarse ||
        (ion_mode_ == IonMode::Mobile && state.ions.coarse.size() != coarse)) {
        throw ConfigurationError("restored plasma does not match the configured coarse lattice");
    }
    if (ion_mode_ == IonMode::Immobile && !state.ions.coarse.empty()) {
        throw ConfigurationError("restored state carries " + std::to_string(state.ions.coarse.size())
                                 + " mobile ions, configuration has immobile ions");
    }
    state_ = std::move(state);
}


// ------------------------------ deposition -----------------------------------

SourceTerms XiStepper::deposit_plasma(const std::vector<Particle>& fine_e,
                                      const std::vector<Particle>& fine_i) const {
    SourceTerms src = deposit(fine_e, grid_, table_);
    if (!fine_i.empty()) accumulate(src, deposit(fine_i, grid_, table_));
    accumulate(src, background_.source_contribution(grid_));
    return src;
}

SourceTerms XiStepper::deposit_beam_layer(const BeamState& beam, double xi_lo, double xi_step) const {
    std::vector<Particle> layer;
    for (auto it = beam.pending.rbegin(); it != beam.pending.rend() && it->xi > xi_lo; ++it) {
        layer.push_back(*it);
    }
    return deposit(layer, grid_, table_, xi_step);
}


// ------------------------------ fixed point ----------------------------------

FixedPointResult XiStepper::solve_slice(const SimulationState& start, const SourceTerms& beam_sources,
                                        double xi_step, const FieldSet* initial_guess) const {
    FixedPointResult r;
    r.electrons = start.electrons;
    r.ions      = start.ions;

    const bool mobile = (ion_mode_ == IonMode::Mobile);
    const FieldSet &prev = start.fields;

    std::vector<Particle> est_e = pusher_.estimate(start.electrons.coarse, xi_step);
    std::vector<Particle> est_i;
    if (mobile) est_i = pusher_.estimate(start.ions.coarse, xi_step);

    // per-slice refresh: one fine sample from the slice-start plasma, pushed
    // alongside the coarse one
    std::vector<Particle> fine_start_e, fine_start_i, fine_est_e, fine_est_i;
    if (refresh_ == FineRefresh::PerSlice) {
        fine_start_e = fine_sample(start.electrons, layout_);
        fine_start_i = fine_sample(start.ions, layout_);
        fine_est_e = pusher_.estimate(fine_start_e, xi_step);
        fine_est_i = pusher_.estimate(fine_start_i, xi_step);
    }

    FieldSet guess = initial_guess ? *initial_guess : prev;
    for (int it = 1; it <= g_.max_iterations; ++it) {
        const FieldSet avg = average(guess, prev);

        r.electrons.coarse = pusher_.push(start.electrons.coarse, est_e, avg, xi_step);
        if (mobile) r.ions.coarse = pusher_.push(start.ions.coarse, est_i, avg, xi_step);

        std::vector<Particle> fine_e, fine_i;
        if (refresh_ == FineRefresh::PerIteration) {
            fine_e = fine_sample(r.electrons, layout_);
            fine_i = fine_sample(r.ions, layout_);
        } else {
            fine_e = pusher_.push(fine_start_e, fine_est_e, avg, xi_step);
            fine_i = pusher_.push(fine_start_i, fine_est_i, avg, xi_step);
            fine_est_e = fine_e;
            fine_est_i = fine_i;
        }

        r.sources = deposit_plasma(fine_e, fine_i);
        accumulate(r.sources, beam_sources);

        r.fields = solver_.solve(r.sources, start.sources, avg, xi_step);
        r.iterations  = it;
        r.last_change = max_abs_diff(r.fields, guess);

        est_e = r.electrons.coarse;
        if (mobile) est_i = r.ions.coarse;
        guess = r.fields;

        if (!std::isfinite(r.last_change)) break;
        const double scale = std::max(1.0, r.fields.max_abs());
        if (it >= g_.min_iterations && r.last_change < g_.tolerance * scale) {
            r.status = FixedPointStatus::Converged;
            break;
        }
    }
    return r;
}


// ------------------------------- stepping ------------------------------------

bool XiStepper::finished() const {
    return state_.xi <= g_.xi_end + 1e-9 * g_.xi_step;
}

bool XiStepper::observe_due() const {
    const int n = g_.diagnostics_each_n_slices;
    if (finished()) return true;
    return n > 0 && state_.xi_index % n == 0;
}

bool XiStepper::checkpoint_due() const {
    const int n = g_.checkpoint_each_n_slices;
    return n > 0 && !g_.checkpoint_path.empty() && state_.xi_index % n == 0;
}

void XiStepper::step() {
    if (finished()) return;

    const int slice = state_.xi_index;
    const double remaining = state_.xi - g_.xi_end;
    double dxi = std::min(state_.xi_step, remaining);
    // do not leave a sliver of a slice at the end
    if (remaining - dxi < 1e-6 * g_.xi_step) dxi = remaining;

    int failures_at_min = 0;
    while (true) {
        const double xi_lo = state_.xi - dxi;
        const SourceTerms beam_sources = deposit_beam_layer(state_.beam, xi_lo, dxi);
        FixedPointResult r = solve_slice(state_, beam_sources, dxi);

        if (r.converged()) {
            check_charge_conservation(r.sources, grid_, g_.charge_tolerance, slice);

            state_.plasma_lost += count_removed(state_.electrons, r.electrons);
            state_.plasma_lost += count_removed(state_.ions, r.ions);

            take_slice_layer(state_.beam, xi_lo);
            advancer_.advance(state_.beam, r.fields);

            state_.electrons = std::move(r.electrons);
            state_.ions      = std::move(r.ions);
            state_.fields    = std::move(r.fields);
            state_.sources   = std::move(r.sources);
            state_.xi        = xi_lo;
            state_.xi_index++;
            state_.xi_step   = std::min(g_.xi_step, 2.0 * dxi);
            return;
        }

        retries_total_++;
        if (dxi <= min_step_ * (1.0 + 1e-12)) {
            failures_at_min++;
            if (failures_at_min > g_.max_retries) {
                throw NonConvergenceError(slice, r.iterations, r.last_change);
            }
            std::cerr << "WARN: slice " << slice << " did not converge at the minimum step "
                      << dxi << " (change " << r.last_change << "), retry "
                      << failures_at_min << " of " << g_.max_retries << "\n";
        } else {
            const double smaller = std::max(0.5 * dxi, min_step_);
            std::cerr << "WARN: slice " << slice << " did not converge after " << r.iterations
                      << " iterations (change " << r.last_change << "), xi_step "
                      << dxi << " -> " << smaller << "\n";
            dxi = smaller;
        }
    }
}

bool XiStepper::run(const std::atomic<bool>* stop, const SliceObserver& observer,
                    const SliceObserver& every_slice) {
    while (!finished()) {
        if (stop && stop->load()) return false;
        step();
        if (every_slice) every_slice(state_);
        if (observer && observe_due()) observer(state_);
    }
    return true;
}
