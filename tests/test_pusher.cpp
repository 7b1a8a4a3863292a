#include <gtest/gtest.h>

#include <cmath>

#include "errors.h"
#include "pusher.h"
#include "test_config.h"

namespace {

class PusherTest : public ::testing::Test {
protected:
    Garage       g = small_plasma_config();
    Grid         grid{g.grid_steps, g.grid_step_size};
    SpeciesTable table = make_species_table(g);
    double       wall = reflect_wall(g);

    Particle electron(double x, double y) const {
        Particle p;
        p.species = Species::PlasmaElectron;
        p.x = p.x_init = x;
        p.y = p.y_init = y;
        p.weight = 1.0;
        return p;
    }
};

} // namespace

TEST_F(PusherTest, WallSitsInsideThePadding) {
    EXPECT_DOUBLE_EQ(wall, 0.1 * (20.5 - 4));
    EXPECT_LT(wall, grid.extent_hi());
}

TEST_F(PusherTest, ParticleAtRestInZeroFieldStaysPut) {
    PlasmaPusher pusher(grid, table, BoundaryPolicy::Reflect, wall);
    const std::vector<Particle> start = {electron(0.3, -0.2)};
    const auto est = pusher.estimate(start, 0.1);
    const auto out = pusher.push(start, est, FieldSet(g.grid_steps), 0.1);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].x, 0.3);
    EXPECT_EQ(out[0].y, -0.2);
    EXPECT_EQ(out[0].px, 0.0);
    EXPECT_EQ(out[0].pz, 0.0);
    EXPECT_TRUE(out[0].alive);
}

TEST_F(PusherTest, UniformExAcceleratesElectronsBackwards) {
    PlasmaPusher pusher(grid, table, BoundaryPolicy::Reflect, wall);
    FieldSet fields(g.grid_steps);
    fields.Ex.fill(1.0);

    const std::vector<Particle> start = {electron(0.0, 0.0)};
    const auto out = pusher.push(start, pusher.estimate(start, 0.1), fields, 0.1);

    // q = -1, v = 0 at the start and pz stays 0: dpx = q Ex dxi
    EXPECT_DOUBLE_EQ(out[0].px, -0.1);
    EXPECT_EQ(out[0].py, 0.0);
    EXPECT_EQ(out[0].pz, 0.0);
    EXPECT_LT(out[0].x, 0.0);
}

TEST_F(PusherTest, ReflectMirrorsPositionAndMomentum) {
    PlasmaPusher pusher(grid, table, BoundaryPolicy::Reflect, wall);
    Particle p = electron(wall + 0.05, 0.0);
    p.px = 0.4;

    EXPECT_TRUE(pusher.apply_boundary(p));
    EXPECT_TRUE(p.alive);
    EXPECT_NEAR(p.x, wall - 0.05, 1e-14);
    EXPECT_EQ(p.px, -0.4);
}

TEST_F(PusherTest, ParticleExactlyOnTheWallIsHandled) {
    PlasmaPusher remover(grid, table, BoundaryPolicy::Remove, wall);
    Particle p = electron(-wall, 0.0);
    EXPECT_FALSE(remover.apply_boundary(p));
    EXPECT_FALSE(p.alive);

    PlasmaPusher reflector(grid, table, BoundaryPolicy::Reflect, wall);
    Particle q = electron(0.0, wall);
    q.py = 0.2;
    EXPECT_TRUE(reflector.apply_boundary(q));
    EXPECT_EQ(q.py, -0.2);
}

TEST_F(PusherTest, NonFinitePositionIsRemovedUnderEitherPolicy) {
    PlasmaPusher pusher(grid, table, BoundaryPolicy::Reflect, wall);
    Particle p = electron(std::nan(""), 0.0);
    EXPECT_FALSE(pusher.apply_boundary(p));
    EXPECT_FALSE(p.alive);
}

TEST_F(PusherTest, RemovePolicyDropsParticlesLeavingThroughTheWall) {
    PlasmaPusher pusher(grid, table, BoundaryPolicy::Remove, wall);
    Particle p = electron(wall - 0.01, 0.0);
    p.px = 5.0;
    const std::vector<Particle> start = {p, electron(0.0, 0.0)};
    const auto out = pusher.push(start, pusher.estimate(start, 0.1), FieldSet(g.grid_steps), 0.1);

    EXPECT_FALSE(out[0].alive);
    EXPECT_TRUE(out[1].alive);

    // dead particles are not pushed again
    const auto again = pusher.push(out, out, FieldSet(g.grid_steps), 0.1);
    EXPECT_FALSE(again[0].alive);
    EXPECT_EQ(again[0].x, out[0].x);
}

TEST_F(PusherTest, EstimateMirrorsButKeepsMomentum) {
    PlasmaPusher pusher(grid, table, BoundaryPolicy::Reflect, wall);
    Particle p = electron(wall - 0.01, 0.0);
    p.px = 5.0;
    const auto est = pusher.estimate({p}, 0.1);
    EXPECT_LT(est[0].x, wall);
    EXPECT_EQ(est[0].px, 5.0);
}

TEST_F(PusherTest, ParseBoundaryPolicy) {
    EXPECT_EQ(parse_boundary_policy("reflect"), BoundaryPolicy::Reflect);
    EXPECT_EQ(parse_boundary_policy("remove"), BoundaryPolicy::Remove);
    EXPECT_THROW(parse_boundary_policy("absorb"), ConfigurationError);
}


// ------------------------------- refinement ----------------------------------

TEST(Refine, UnperturbedLatticeGivesEqualFineParticles) {
    const Garage g = small_plasma_config();
    const FineLayout layout = make_fine_layout(g);
    const PlasmaPopulation pop = make_plasma(g, layout, Species::PlasmaElectron);

    ASSERT_EQ(pop.coarse.size(), static_cast<size_t>(layout.nc) * layout.nc);
    const double expected = pop.coarse[0].weight * layout.smallness;

    const std::vector<Particle> fine = refine(pop, layout);
    ASSERT_EQ(fine.size(), static_cast<size_t>(layout.nf) * layout.nf);
    for (const auto &f : fine) {
        EXPECT_NEAR(f.weight, expected, 1e-12 * expected);
        EXPECT_NEAR(f.x, f.x_init, 1e-15);
        EXPECT_EQ(f.px, 0.0);
    }
}

TEST(Refine, FollowsCoarseDisplacementAndSkipsDeadCorners) {
    const Garage g = small_plasma_config();
    const FineLayout layout = make_fine_layout(g);
    PlasmaPopulation pop = make_plasma(g, layout, Species::PlasmaElectron);
    for (auto &c : pop.coarse) {
        c.x += 0.01;
        c.px = 0.2;
    }
    pop.coarse[0].alive = false;

    const std::vector<Particle> fine = refine(pop, layout);
    ASSERT_FALSE(fine.empty());
    for (const auto &f : fine) {
        EXPECT_NEAR(f.x - f.x_init, 0.01, 1e-12);
        EXPECT_NEAR(f.px, 0.2, 1e-12);
        EXPECT_TRUE(std::isfinite(f.weight));
        EXPECT_GT(f.weight, 0.0);
    }
}
