#include "deposition.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>


SourceTerms deposit(const std::vector<Particle>& particles, const Grid& grid,
                    const SpeciesTable& table, double xi_step) {
    SourceTerms out(grid.steps());
    const double inv_area = 1.0 / grid.cell_area();

    for (const auto &p : particles) {
        if (!p.alive) continue;

        const SpeciesTraits &sp = table[p.species];

        Stencil s;
        try {
            s = grid.interpolation_weights(p.x, p.y);
        } catch (const OutOfDomainError&) {
            out.skipped++;
            continue;
        }

        if (sp.deposit == DepositKind::Beam) {
            // ultra-relativistic: charge and jz coincide
            const double dq = sp.charge * p.weight / xi_step;
            grid.deposit(out.ro, s, dq * inv_area);
            grid.deposit(out.jz, s, dq * inv_area);
            out.particle_charge += dq;
            out.abs_charge      += std::abs(dq);
            continue;
        }

        const double m = sp.mass;
        const double gamma_m = std::sqrt(m * m + p.px * p.px + p.py * p.py + p.pz * p.pz);
        const double dq = sp.charge * p.weight / (1.0 - p.pz / gamma_m);
        const double v  = dq / gamma_m;

        grid.deposit(out.ro, s, dq * inv_area);
        grid.deposit(out.jx, s, p.px * v * inv_area);
        grid.deposit(out.jy, s, p.py * v * inv_area);
        grid.deposit(out.jz, s, p.pz * v * inv_area);
        out.particle_charge += dq;
        out.abs_charge      += std::abs(dq);
    }
    return out;
}

static void add_field(Field2D& out, const Field2D& in) {
    for (size_t k = 0; k < out.data.size(); ++k) out.data[k] += in.data[k];
}

void accumulate(SourceTerms& out, const SourceTerms& in) {
    add_field(out.ro, in.ro);
    add_field(out.jx, in.jx);
    add_field(out.jy, in.jy);
    add_field(out.jz, in.jz);
    out.particle_charge += in.particle_charge;
    out.abs_charge      += in.abs_charge;
    out.skipped         += in.skipped;
}

void check_charge_conservation(const SourceTerms& src, const Grid& grid,
                               double tolerance, int slice) {
    const double grid_charge = src.ro.sum() * grid.cell_area();
    const double diff = std::abs(grid_charge - src.particle_charge);
    const double scale = std::max(src.abs_charge, 1e-300);

    if (!std::isfinite(grid_charge) || diff > tolerance * scale) {
        std::ostringstream msg;
        msg.precision(17);
        msg << "deposited charge " << grid_charge << " differs from particle charge "
            << src.particle_charge << " (relative error " << diff / scale
            << ", tolerance " << tolerance << ")";
        throw InvalidSourceTermsError(slice, msg.str());
    }
}
