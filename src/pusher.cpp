#include "pusher.h"
#include "errors.h"

#include <cmath>


BoundaryPolicy parse_boundary_policy(const std::string& name) {
    if (name == "reflect") return BoundaryPolicy::Reflect;
    if (name == "remove")  return BoundaryPolicy::Remove;
    throw ConfigurationError("plasma.boundary: expected 'reflect' or 'remove', got '" + name + "'");
}

double reflect_wall(const Garage& g) {
    return g.grid_step_size * (g.grid_steps / 2.0 - g.reflect_padding_steps);
}


// ------------------------------- plasma --------------------------------------

PlasmaPusher::PlasmaPusher(const Grid& grid, const SpeciesTable& table,
                           BoundaryPolicy policy, double wall)
    : grid_(grid), table_(table), policy_(policy), wall_(wall) {}

bool PlasmaPusher::apply_boundary(Particle& p) const {
    const bool out_x = !(p.x < wall_ && p.x > -wall_);  // NaN counts as out
    const bool out_y = !(p.y < wall_ && p.y > -wall_);
    if (!out_x && !out_y) return true;

    if (policy_ == BoundaryPolicy::Remove || !std::isfinite(p.x) || !std::isfinite(p.y)) {
        p.alive = false;
        return false;
    }

    if (p.x >= wall_)  { p.x = 2.0 * wall_ - p.x;  p.px = -p.px; }
    if (p.x <= -wall_) { p.x = -2.0 * wall_ - p.x; p.px = -p.px; }
    if (p.y >= wall_)  { p.y = 2.0 * wall_ - p.y;  p.py = -p.py; }
    if (p.y <= -wall_) { p.y = -2.0 * wall_ - p.y; p.py = -p.py; }

    // more than one wall width in a single step
    if (!grid_.contains(p.x, p.y)) {
        p.alive = false;
        return false;
    }
    return true;
}

std::vector<Particle> PlasmaPusher::estimate(const std::vector<Particle>& start, double xi_step) const {
    std::vector<Particle> out(start);
    for (auto &p : out) {
        if (!p.alive) continue;
        const double m = table_[p.species].mass;
        const double gamma_m = std::sqrt(m * m + p.px * p.px + p.py * p.py + p.pz * p.pz);
        p.x += p.px / (gamma_m - p.pz) * xi_step;
        p.y += p.py / (gamma_m - p.pz) * xi_step;

        // estimates are only mirrored, momentum is left alone
        if (p.x >  wall_) p.x =  2.0 * wall_ - p.x;
        if (p.x < -wall_) p.x = -2.0 * wall_ - p.x;
        if (p.y >  wall_) p.y =  2.0 * wall_ - p.y;
        if (p.y < -wall_) p.y = -2.0 * wall_ - p.y;
    }
    return out;
}

std::vector<Particle> PlasmaPusher::push(const std::vector<Particle>& start,
                                         const std::vector<Particle>& estimate,
                                         const FieldSet& fields, double xi_step) const {
    std::vector<Particle> out(start);

    for (size_t k = 0; k < out.size(); ++k) {
        Particle &p = out[k];
        if (!p.alive) continue;
        if (!estimate[k].alive) {  // removed by the previous iterate
            p.alive = false;
            continue;
        }

        const SpeciesTraits &sp = table_[p.species];
        const double m = sp.mass;
        const double q = sp.charge;

        Particle half = p;
        half.x = 0.5 * (p.x + estimate[k].x);
        half.y = 0.5 * (p.y + estimate[k].y);

        Stencil s;
        try {
            s = grid_.interpolation_weights(half.x, half.y);
        } catch (const OutOfDomainError&) {
            if (!apply_boundary(half)) {
                p.alive = false;
                continue;
            }
            s = grid_.interpolation_weights(half.x, half.y);
        }

        const double Ex = grid_.interpolate(fields.Ex, s);
        const double Ey = grid_.interpolate(fields.Ey, s);
        const double Ez = grid_.interpolate(fields.Ez, s);
        const double Bx = grid_.interpolate(fields.Bx, s);
        const double By = grid_.interpolate(fields.By, s);
        const double Bz = grid_.interpolate(fields.Bz, s);

        const double opx = p.px, opy = p.py, opz = p.pz;
        double px = opx, py = opy, pz = opz;
        double dpx = 0.0, dpy = 0.0, dpz = 0.0;

        // two passes to evaluate the force with the half-step momentum
        for (int pass = 0; pass < 2; ++pass) {
            const double gamma_m = std::sqrt(m * m + px * px + py * py + pz * pz);
            const double vx = px / gamma_m, vy = py / gamma_m, vz = pz / gamma_m;
            const double factor = q * xi_step / (1.0 - vz);
            dpx = factor * (Ex + vy * Bz - vz * By);
            dpy = factor * (Ey - vx * Bz + vz * Bx);
            dpz = factor * (Ez + vx * By - vy * Bx);
            px = opx + 0.5 * dpx;
            py = opy + 0.5 * dpy;
            pz = opz + 0.5 * dpz;
        }

        const double gamma_m = std::sqrt(m * m + px * px + py * py + pz * pz);
        p.x += px / (gamma_m - pz) * xi_step;
        p.y += py / (gamma_m - pz) * xi_step;

        p.px = opx + dpx;
        p.py = opy + dpy;
        p.pz = opz + dpz;

        apply_boundary(p);
    }
    return out;
}


// -------------------------------- beam ---------------------------------------

BeamAdvancer::BeamAdvancer(const Grid& grid, const SpeciesTable& table, double time_step)
    : grid_(grid), table_(table), dt_(time_step) {}

int64_t BeamAdvancer::advance(BeamState& beam, const FieldSet& fields) const {
    int64_t removed = 0;

    for (auto &p : beam.active) {
        const SpeciesTraits &sp = table_[p.species];

        if (dt_ > 0.0) {
            Stencil s;
            try {
                s = grid_.interpolation_weights(p.x, p.y);
            } catch (const OutOfDomainError&) {
                removed++;
                continue;
            }
            const double Ex = grid_.interpolate(fields.Ex, s);
            const double Ey = grid_.interpolate(fields.Ey, s);
            const double Ez = grid_.interpolate(fields.Ez, s);
            const double Bx = grid_.interpolate(fields.Bx, s);
            const double By = grid_.interpolate(fields.By, s);
            const double Bz = grid_.interpolate(fields.Bz, s);

            const double m = sp.mass;
            double gamma_m = std::sqrt(m * m + p.px * p.px + p.py * p.py + p.pz * p.pz);
            double vx = p.px / gamma_m, vy = p.py / gamma_m, vz = p.pz / gamma_m;

            p.px += sp.charge * (Ex + vy * Bz - vz * By) * dt_;
            p.py += sp.charge * (Ey - vx * Bz + vz * Bx) * dt_;
            p.pz += sp.charge * (Ez + vx * By - vy * Bx) * dt_;

            gamma_m = std::sqrt(m * m + p.px * p.px + p.py * p.py + p.pz * p.pz);
            vx = p.px / gamma_m; vy = p.py / gamma_m; vz = p.pz / gamma_m;

            p.x  += vx * dt_;
            p.y  += vy * dt_;
            p.xi += (vz - 1.0) * dt_;
        }

        if (!grid_.contains(p.x, p.y)) {
            removed++;
            continue;
        }
        beam.census.push_back(p);
    }

    beam.active.clear();
    beam.lost += removed;
    return removed;
}
