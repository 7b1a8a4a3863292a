#include <gtest/gtest.h>

#include <cmath>

#include "deposition.h"
#include "errors.h"
#include "garage.h"

namespace {

class DepositionTest : public ::testing::Test {
protected:
    Garage       g;
    Grid         grid{21, 0.1};
    SpeciesTable table = make_species_table(g);

    Particle electron(double x, double y, double w) const {
        Particle p;
        p.species = Species::PlasmaElectron;
        p.x = x;
        p.y = y;
        p.weight = w;
        return p;
    }
};

} // namespace

TEST_F(DepositionTest, ElectronAtRestDepositsItsCharge) {
    const SourceTerms src = deposit({electron(0.013, -0.042, 2.0)}, grid, table);

    EXPECT_NEAR(src.ro.sum() * grid.cell_area(), -2.0, 1e-13);
    EXPECT_DOUBLE_EQ(src.particle_charge, -2.0);
    EXPECT_DOUBLE_EQ(src.abs_charge, 2.0);
    EXPECT_EQ(src.jx.max_abs(), 0.0);
    EXPECT_EQ(src.jy.max_abs(), 0.0);
    EXPECT_EQ(src.jz.max_abs(), 0.0);
}

TEST_F(DepositionTest, MovingElectronCarriesCurrent) {
    Particle p = electron(0.0, 0.0, 1.0);
    p.px = 0.3;
    p.pz = -0.2;
    const double gamma_m = std::sqrt(1.0 + 0.09 + 0.04);
    const double dq = -1.0 / (1.0 + 0.2 / gamma_m);

    const SourceTerms src = deposit({p}, grid, table);
    const double area = grid.cell_area();
    EXPECT_NEAR(src.ro.sum() * area, dq, 1e-13);
    EXPECT_NEAR(src.jx.sum() * area, dq * 0.3 / gamma_m, 1e-13);
    EXPECT_NEAR(src.jz.sum() * area, dq * -0.2 / gamma_m, 1e-13);
    EXPECT_EQ(src.jy.max_abs(), 0.0);
}

TEST_F(DepositionTest, BeamParticlesDepositPerUnitXi) {
    Particle b;
    b.species = Species::Beam;
    b.weight = 0.5;
    b.pz = 1000.0;

    const SourceTerms src = deposit({b}, grid, table, 0.25);
    EXPECT_NEAR(src.ro.sum() * grid.cell_area(), g.beam_charge * 0.5 / 0.25, 1e-13);
    for (size_t k = 0; k < src.ro.data.size(); ++k) {
        EXPECT_EQ(src.ro.data[k], src.jz.data[k]);
    }
}

TEST_F(DepositionTest, DeadAndOutsideParticlesAreSkipped) {
    Particle dead = electron(0.0, 0.0, 1.0);
    dead.alive = false;
    const Particle outside = electron(5.0, 0.0, 1.0);

    const SourceTerms src = deposit({dead, outside}, grid, table);
    EXPECT_EQ(src.ro.max_abs(), 0.0);
    EXPECT_EQ(src.skipped, 1);
    EXPECT_EQ(src.particle_charge, 0.0);
}

TEST_F(DepositionTest, AccumulateAddsFieldsAndTotals) {
    SourceTerms a = deposit({electron(0.1, 0.1, 1.0)}, grid, table);
    const SourceTerms b = deposit({electron(-0.1, 0.0, 3.0)}, grid, table);
    accumulate(a, b);
    EXPECT_NEAR(a.ro.sum() * grid.cell_area(), -4.0, 1e-13);
    EXPECT_DOUBLE_EQ(a.particle_charge, -4.0);
    EXPECT_DOUBLE_EQ(a.abs_charge, 4.0);
}

TEST_F(DepositionTest, ChargeConservationCheck) {
    SourceTerms src = deposit({electron(0.2, -0.3, 1.0), electron(-0.95, 0.95, 1.0)}, grid, table);
    EXPECT_NO_THROW(check_charge_conservation(src, grid, 1e-10, 0));

    src.ro(3, 3) += 1.0;
    EXPECT_THROW(check_charge_conservation(src, grid, 1e-10, 7), InvalidSourceTermsError);

    src.ro(3, 3) = std::nan("");
    try {
        check_charge_conservation(src, grid, 1e-10, 7);
        FAIL() << "expected InvalidSourceTermsError";
    } catch (const InvalidSourceTermsError& e) {
        EXPECT_EQ(e.slice, 7);
    }
}

TEST_F(DepositionTest, OffGridParticlesDoNotUpsetTheChargeCheck) {
    SourceTerms src = deposit({electron(0.2, -0.3, 1.0), electron(7.0, 0.0, 5.0),
                               electron(0.0, -3.0, 2.0)}, grid, table);
    EXPECT_EQ(src.skipped, 2);
    EXPECT_DOUBLE_EQ(src.particle_charge, -1.0);
    EXPECT_NO_THROW(check_charge_conservation(src, grid, 1e-10, 0));

    // accumulated with an in-grid population
    accumulate(src, deposit({electron(-0.4, 0.5, 3.0)}, grid, table));
    EXPECT_EQ(src.skipped, 2);
    EXPECT_NO_THROW(check_charge_conservation(src, grid, 1e-10, 0));
}
