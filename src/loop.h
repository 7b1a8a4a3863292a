#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "background_ions.h"
#include "deposition.h"
#include "field_solver.h"
#include "garage.h"
#include "grid.h"
#include "particles.h"
#include "pusher.h"

// Everything that evolves from slice to slice. Owned by the XiStepper;
// observers and checkpoints only ever see it read-only.
struct SimulationState {
    int    xi_index = 0;    // slices completed
    double xi       = 0.0;  // leading edge of the next slice
    double xi_step  = 0.0;  // step for the next slice (adaptive)

    PlasmaPopulation electrons;
    PlasmaPopulation ions;  // coarse is empty unless ions are mobile
    BeamState        beam;

    FieldSet    fields;     // last converged fields, seed of the next solve
    SourceTerms sources;    // last slice's total sources, for djx/dxi

    int64_t plasma_lost = 0;  // coarse plasma particles removed at the walls
};

// How the fine sample is regenerated inside the fixed-point loop.
enum class FineRefresh { PerIteration, PerSlice };

// "per_iteration" | "per_slice", throws ConfigurationError otherwise
FineRefresh parse_fine_refresh(const std::string& name);

enum class FixedPointStatus { Converged, Diverged };

// Outcome of one slice's fixed-point loop. Numerical failure is reported
// here, never thrown.
struct FixedPointResult {
    FixedPointStatus status = FixedPointStatus::Diverged;
    FieldSet         fields;      // last iterate
    SourceTerms      sources;     // sources it was solved from
    PlasmaPopulation electrons;   // coarse state after the push
    PlasmaPopulation ions;
    int              iterations  = 0;
    double           last_change = 0.0;

    bool converged() const { return status == FixedPointStatus::Converged; }
};

using SliceObserver = std::function<void(const SimulationState&)>;


class XiStepper {
public:
    // Validated configuration in, initial state out (xi = xi_start).
    explicit XiStepper(const Garage& g);

    // the pusher and advancer hold references into the stepper
    XiStepper(const XiStepper&) = delete;
    XiStepper& operator=(const XiStepper&) = delete;

    // Replace the state, e.g. with one read back from a checkpoint
    void restore(SimulationState state);

    // Fixed-point loop of one slice starting from `start`, with the beam
    // layer's sources already deposited. The iteration is seeded with
    // `initial_guess`, or the slice-start fields when null. Does not touch
    // the stepper state.
    FixedPointResult solve_slice(const SimulationState& start, const SourceTerms& beam_sources,
                                 double xi_step, const FieldSet* initial_guess = nullptr) const;

    // Deposit of the beam particles that enter the slice (xi_lo, start xi]
    SourceTerms deposit_beam_layer(const BeamState& beam, double xi_lo, double xi_step) const;

    // One slice with adaptive step retries. Throws NonConvergenceError when
    // the minimum step keeps failing and InvalidSourceTermsError when the
    // converged sources do not conserve charge.
    void step();

    // Steps until xi_end or until *stop becomes true (checked between
    // slices). `every_slice` runs after each slice, then the observer at the
    // diagnostics cadence and after the last slice. Returns false if stopped
    // early.
    bool run(const std::atomic<bool>* stop, const SliceObserver& observer,
             const SliceObserver& every_slice = SliceObserver());

    bool finished() const;
    bool observe_due() const;     // diagnostics cadence, after step()
    bool checkpoint_due() const;  // checkpoint cadence, after step()

    const SimulationState& state() const { return state_; }
    const Garage&          settings() const { return g_; }
    const Grid&            grid() const { return grid_; }
    const SpeciesTable&    species() const { return table_; }
    const FieldSolver&     solver() const { return solver_; }
    const PlasmaPusher&    pusher() const { return pusher_; }
    const FineLayout&      layout() const { return layout_; }
    const BackgroundIons&  background() const { return background_; }
    double nominal_step() const { return g_.xi_step; }
    double minimum_step() const { return min_step_; }
    int    retries() const { return retries_total_; }

private:
    SourceTerms deposit_plasma(const std::vector<Particle>& fine_e,
                               const std::vector<Particle>& fine_i) const;

    Garage         g_;
    Grid           grid_;
    SpeciesTable   table_;
    FineLayout     layout_;
    FieldSolver    solver_;
    PlasmaPusher   pusher_;
    BeamAdvancer   advancer_;
    IonMode        ion_mode_;
    FineRefresh    refresh_;
    BackgroundIons background_;
    double         min_step_;
    int            retries_total_ = 0;

    SimulationState state_;
};
