#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "field_solver.h"
#include "grid.h"
#include "particles.h"

// What happens to a plasma particle that reaches the reflection wall.
enum class BoundaryPolicy { Reflect, Remove };

// "reflect" | "remove", throws ConfigurationError otherwise
BoundaryPolicy parse_boundary_policy(const std::string& name);

// Wall position h (N/2 - reflect_padding_steps)
double reflect_wall(const Garage& g);


// ---------- plasma ----------
class PlasmaPusher {
public:
    PlasmaPusher(const Grid& grid, const SpeciesTable& table,
                 BoundaryPolicy policy, double wall);

    // Field-free ballistic move of the slice-start state, used as the
    // half-step position estimate of the first inner iteration.
    std::vector<Particle> estimate(const std::vector<Particle>& start, double xi_step) const;

    // One xi step from `start` under `fields` (already half-step averaged),
    // sampled at the midpoint of the start position and `estimate`.
    // `start` and `estimate` are index-aligned; the result is too.
    std::vector<Particle> push(const std::vector<Particle>& start,
                               const std::vector<Particle>& estimate,
                               const FieldSet& fields, double xi_step) const;

    // Applies the boundary policy to a particle at or past the wall.
    // Returns false if the particle was removed.
    bool apply_boundary(Particle& p) const;

    BoundaryPolicy policy() const { return policy_; }
    double wall() const { return wall_; }

private:
    const Grid&         grid_;
    const SpeciesTable& table_;
    BoundaryPolicy      policy_;
    double              wall_;
};


// ---------- beam ----------
class BeamAdvancer {
public:
    BeamAdvancer(const Grid& grid, const SpeciesTable& table, double time_step);

    // Advances every active particle by one beam time step under the converged
    // fields of the slice and moves it to census. Particles that leave the
    // transverse extent are dropped and counted in beam.lost.
    // Returns the number of particles removed.
    int64_t advance(BeamState& beam, const FieldSet& fields) const;

    double time_step() const { return dt_; }

private:
    const Grid&         grid_;
    const SpeciesTable& table_;
    double              dt_;
};
