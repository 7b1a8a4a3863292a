#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "diagnostics.h"
#include "test_config.h"

TEST(GaussianBlur, KeepsConstantsAndZeroWidthIsIdentity) {
    Field2D f(9, 2.5);
    const Field2D blurred = gaussian_blur(f, 1.7);
    for (double v : blurred.data) EXPECT_NEAR(v, 2.5, 1e-13);

    Field2D spike(9);
    spike(4, 4) = 1.0;
    EXPECT_EQ(gaussian_blur(spike, 0.0).data, spike.data);
}

TEST(GaussianBlur, MirroredEdgesConserveTheSum) {
    Field2D spike(11);
    spike(0, 3) = 1.0;
    const Field2D blurred = gaussian_blur(spike, 1.5);
    EXPECT_NEAR(blurred.sum(), 1.0, 1e-13);
    EXPECT_GT(blurred(1, 3), blurred(2, 3));
}

TEST(ZnMetric, SmoothDensityHasNoNoise) {
    EXPECT_NEAR(zn_metric(Field2D(21, -1.0), 0.1), 0.0, 1e-12);

    Field2D noisy(21);
    for (int i = 0; i < 21; ++i)
        for (int j = 0; j < 21; ++j) noisy(i, j) = ((i + j) % 2) ? 1e-3 : -1e-3;
    EXPECT_GT(zn_metric(noisy, 0.1), 0.5);
}

TEST(LocalMaxima, OnlyStrictInteriorPeaks) {
    const std::vector<double> v = {3.0, 1.0, 2.0, 1.0, 4.0, 4.0, 0.0, 5.0};
    EXPECT_EQ(local_maxima(v), (std::vector<size_t>{2}));
    EXPECT_TRUE(local_maxima({}).empty());
}

TEST(Diagnostics, ConsoleLineAndPeakTracking) {
    const Garage g = small_plasma_config();
    const Grid grid(g.grid_steps, g.grid_step_size);
    Diagnostics diags(g, grid);

    SimulationState s;
    s.fields  = FieldSet(g.grid_steps);
    s.sources = SourceTerms(g.grid_steps);
    const int c = g.grid_steps / 2;
    const double ez[] = {0.0, 0.02, 0.01, 0.0, 0.019, 0.005};
    for (int k = 0; k < 6; ++k) {
        s.xi = -0.1 * (k + 1);
        s.fields.Ez(c, c) = ez[k];
        diags.record(s);
        if (k == 0) EXPECT_EQ(diags.peak_report(), "...");
    }

    EXPECT_EQ(diags.ez_00_history().size(), 6u);
    EXPECT_EQ(diags.xi_history().back(), s.xi);

    const std::string line = diags.line();
    EXPECT_EQ(line.rfind("xi=-0.6000 +5.0000e-03|", 0), 0u) << line;
    EXPECT_NE(line.find("|1.9000e-02 -5.00%|"), std::string::npos) << line;
    EXPECT_NE(line.find("|zn=0.000"), std::string::npos) << line;
}

TEST(Diagnostics, SpectrumTalliesNewCensusParticlesOnce) {
    Garage g = small_plasma_config();
    g.beam_pz = 100.0;
    const Grid grid(g.grid_steps, g.grid_step_size);
    Diagnostics diags(g, grid);

    SimulationState s;
    s.fields  = FieldSet(g.grid_steps);
    s.sources = SourceTerms(g.grid_steps);

    Particle p;
    p.species = Species::Beam;
    p.xi = -0.15;
    p.pz = 100.0;
    p.weight = 0.5;
    s.beam.census.push_back(p);
    diags.record(s);
    diags.record(s);

    const Tally &t = diags.beam_spectrum();
    EXPECT_DOUBLE_EQ(t.retrieve("beam", {{"xi", -0.15}, {"pz", 100.0}}), 0.5);

    // census already tallied before a resume
    Diagnostics resumed(g, grid);
    resumed.skip_census(1);
    resumed.record(s);
    EXPECT_EQ(resumed.beam_spectrum().retrieve("beam", {{"xi", -0.15}, {"pz", 100.0}}), 0.0);
}
