#include <gtest/gtest.h>

#include <algorithm>

#include "background_ions.h"
#include "errors.h"
#include "pusher.h"
#include "test_config.h"


// ----------------------------- background ions -------------------------------

TEST(BackgroundIons, ImmobileIonsNeutraliseTheInitialPlasma) {
    const Garage g = small_plasma_config();
    const Grid grid(g.grid_steps, g.grid_step_size);
    const SpeciesTable table = make_species_table(g);
    const FineLayout layout = make_fine_layout(g);
    const PlasmaPopulation electrons = make_plasma(g, layout, Species::PlasmaElectron);

    const SourceTerms e = deposit(refine(electrons, layout), grid, table);
    const BackgroundIons ions = BackgroundIons::immobile(e);
    EXPECT_EQ(ions.mode(), IonMode::Immobile);

    SourceTerms total = e;
    accumulate(total, ions.source_contribution(grid));
    EXPECT_EQ(total.ro.max_abs(), 0.0);
    EXPECT_EQ(total.particle_charge, 0.0);
    EXPECT_EQ(ions.source_contribution(grid).jz.max_abs(), 0.0);
    EXPECT_NO_THROW(check_charge_conservation(total, grid, 1e-10, 0));
}

TEST(BackgroundIons, MobileBackgroundIsEmpty) {
    const Grid grid(15, 0.1);
    const BackgroundIons ions = BackgroundIons::mobile(grid);
    EXPECT_EQ(ions.mode(), IonMode::Mobile);
    EXPECT_EQ(ions.source_contribution(grid).ro.max_abs(), 0.0);
}

TEST(BackgroundIons, RejectsAnotherGrid) {
    const BackgroundIons ions = BackgroundIons::mobile(Grid(15, 0.1));
    EXPECT_THROW(ions.source_contribution(Grid(17, 0.1)), std::invalid_argument);
}

TEST(BackgroundIons, ParseMode) {
    EXPECT_EQ(parse_ion_mode("immobile"), IonMode::Immobile);
    EXPECT_EQ(parse_ion_mode("mobile"), IonMode::Mobile);
    EXPECT_THROW(parse_ion_mode("frozen"), ConfigurationError);
}

TEST(PlasmaProfile, ChannelDeepensOffAxis) {
    Garage g = small_plasma_config();
    g.channel_depth  = 0.5;
    g.channel_radius = 1.0;
    EXPECT_DOUBLE_EQ(plasma_density_at(g, 0.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(plasma_density_at(g, 1.0, 0.0), 1.5);

    g.channel_depth = -2.0;
    EXPECT_EQ(plasma_density_at(g, 1.0, 0.0), 0.0);
}


// ---------------------------------- beam -------------------------------------

TEST(Beam, GaussianBunchIsSortedAndReproducible) {
    const Garage g = small_beam_config();
    const Grid grid(g.grid_steps, g.grid_step_size);

    const BeamState a = make_beam(g, grid);
    const BeamState b = make_beam(g, grid);

    EXPECT_EQ(a.total_count() + static_cast<size_t>(a.lost), static_cast<size_t>(g.beam_particles));
    EXPECT_TRUE(std::is_sorted(a.pending.begin(), a.pending.end(),
                               [](const Particle& p, const Particle& q) { return p.xi < q.xi; }));
    ASSERT_EQ(a.pending.size(), b.pending.size());
    for (size_t k = 0; k < a.pending.size(); ++k) {
        EXPECT_EQ(a.pending[k].x, b.pending[k].x);
        EXPECT_EQ(a.pending[k].xi, b.pending[k].xi);
        EXPECT_EQ(a.pending[k].id, b.pending[k].id);
    }
    for (const auto &p : a.pending) {
        EXPECT_LE(p.xi, g.xi_start);
        EXPECT_GE(p.xi, g.xi_end);
        EXPECT_EQ(p.species, Species::Beam);
    }
}

TEST(Beam, ExplicitParticlesOutsideTheWindowAreDropped) {
    Garage g = small_plasma_config();
    g.beam_explicit.push_back({0.0, 0.0, -0.15, 0.0, 0.0, 100.0, 1.0});
    g.beam_explicit.push_back({0.1, 0.0, -0.05, 0.0, 0.0, 100.0, 2.0});
    g.beam_explicit.push_back({0.0, 0.0, +0.30, 0.0, 0.0, 100.0, 1.0});  // ahead of xi_start
    g.beam_explicit.push_back({9.0, 0.0, -0.20, 0.0, 0.0, 100.0, 1.0});  // off the grid
    const Grid grid(g.grid_steps, g.grid_step_size);

    BeamState beam = make_beam(g, grid);
    EXPECT_EQ(beam.lost, 2);
    ASSERT_EQ(beam.pending.size(), 2u);
    EXPECT_EQ(beam.pending.back().xi, -0.05);

    take_slice_layer(beam, -0.1);
    ASSERT_EQ(beam.active.size(), 1u);
    EXPECT_EQ(beam.active[0].weight, 2.0);
    EXPECT_EQ(beam.pending.size(), 1u);
}

TEST(Beam, AdvancerWithoutTimeStepOnlyMovesToCensus) {
    const Garage g = small_plasma_config();
    const Grid grid(g.grid_steps, g.grid_step_size);
    const SpeciesTable table = make_species_table(g);
    BeamAdvancer advancer(grid, table, 0.0);

    BeamState beam;
    Particle p;
    p.species = Species::Beam;
    p.pz = 100.0;
    p.x = 0.2;
    beam.active.push_back(p);

    FieldSet fields(g.grid_steps);
    fields.Ez.fill(1.0);
    EXPECT_EQ(advancer.advance(beam, fields), 0);
    EXPECT_TRUE(beam.active.empty());
    ASSERT_EQ(beam.census.size(), 1u);
    EXPECT_EQ(beam.census[0].pz, 100.0);
    EXPECT_EQ(beam.census[0].x, 0.2);
}

TEST(Beam, AdvancerKicksAndDropsEscapingParticles) {
    Garage g = small_plasma_config();
    g.beam_charge = -1.0;
    const Grid grid(g.grid_steps, g.grid_step_size);
    const SpeciesTable table = make_species_table(g);
    BeamAdvancer advancer(grid, table, 0.5);

    BeamState beam;
    Particle p;
    p.species = Species::Beam;
    p.pz = 100.0;
    beam.active.push_back(p);

    Particle escaping = p;
    escaping.x  = grid.extent_hi() - 0.01;
    escaping.px = 100.0;
    beam.active.push_back(escaping);

    FieldSet fields(g.grid_steps);
    fields.Ez.fill(2.0);
    EXPECT_EQ(advancer.advance(beam, fields), 1);
    EXPECT_EQ(beam.lost, 1);
    ASSERT_EQ(beam.census.size(), 1u);
    // dpz = q Ez dt
    EXPECT_NEAR(beam.census[0].pz, 100.0 - 1.0, 1e-12);
    EXPECT_LT(beam.census[0].xi, 0.0);
}
