#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <vector>

#include "errors.h"
#include "loop.h"
#include "test_config.h"

namespace {

// E1(x) by its power series, fine for x < 1
double exp_integral_e1(double x) {
    double sum = 0.0, term = 1.0;
    for (int k = 1; k < 40; ++k) {
        term *= -x / k;
        sum += term / k;
    }
    return -0.5772156649015329 - std::log(x) - sum;
}

// integral of the cut Gaussian profile ahead of xi, times cos(xi - xi')
double wake_integral(double xi, double center, double sigma, double cut) {
    const double hi = center + cut * sigma;
    const double lo = std::max(xi, center - cut * sigma);
    if (lo >= hi) return 0.0;
    const int n = 2000;  // Simpson, even
    const double d = (hi - lo) / n;
    double total = 0.0;
    for (int k = 0; k <= n; ++k) {
        const double x = lo + k * d;
        const double f = std::exp(-0.5 * (x - center) * (x - center) / (sigma * sigma)) * std::cos(xi - x);
        total += f * ((k == 0 || k == n) ? 1.0 : (k % 2 ? 4.0 : 2.0));
    }
    return total * d / 3.0;
}

} // namespace


TEST(XiStepper, StartsAtXiStartWithZeroFields) {
    XiStepper stepper(small_plasma_config());
    const SimulationState &s = stepper.state();
    EXPECT_EQ(s.xi_index, 0);
    EXPECT_EQ(s.xi, 0.0);
    EXPECT_EQ(s.fields.max_abs(), 0.0);
    EXPECT_EQ(s.electrons.live_count(), s.electrons.coarse.size());
    EXPECT_TRUE(s.ions.coarse.empty());
    EXPECT_DOUBLE_EQ(stepper.minimum_step(), 0.1 / 16.0);
}

TEST(XiStepper, InvalidConfigurationIsRejected) {
    Garage g = small_plasma_config();
    g.grid_steps = 40;
    EXPECT_THROW(XiStepper{g}, ConfigurationError);

    g = small_plasma_config();
    g.fine_refresh = "sometimes";
    EXPECT_THROW(XiStepper{g}, ConfigurationError);
}

TEST(XiStepper, UniformPlasmaStaysFieldFree) {
    XiStepper stepper(small_plasma_config());
    while (!stepper.finished()) {
        stepper.step();
        EXPECT_EQ(stepper.state().fields.max_abs(), 0.0) << "slice " << stepper.state().xi_index;
        EXPECT_EQ(stepper.state().sources.ro.max_abs(), 0.0);
    }
    EXPECT_EQ(stepper.state().xi_index, 4);
    EXPECT_NEAR(stepper.state().xi, -0.4, 1e-12);
    EXPECT_EQ(stepper.retries(), 0);

    // stepping past the end is a no-op
    stepper.step();
    EXPECT_EQ(stepper.state().xi_index, 4);
}

TEST(XiStepper, MobileIonsAndPerSliceRefreshAlsoStayNeutral) {
    Garage g = small_plasma_config();
    g.ion_mode     = "mobile";
    g.fine_refresh = "per_slice";
    XiStepper stepper(g);
    EXPECT_EQ(stepper.state().ions.coarse.size(), stepper.state().electrons.coarse.size());

    stepper.step();
    EXPECT_LT(stepper.state().fields.max_abs(), 1e-12);
    EXPECT_LT(std::abs(stepper.state().sources.ro.sum()), 1e-9);
}

TEST(XiStepper, ConvergedFieldsAreAFixedPoint) {
    const Garage g = small_beam_config();
    XiStepper stepper(g);
    // advance into the bunch
    for (int k = 0; k < 4; ++k) stepper.step();

    const SimulationState &s = stepper.state();
    const double xi_lo = s.xi - s.xi_step;
    const SourceTerms beam = stepper.deposit_beam_layer(s.beam, xi_lo, s.xi_step);
    const FixedPointResult first = stepper.solve_slice(s, beam, s.xi_step);
    ASSERT_TRUE(first.converged());
    ASSERT_GT(first.fields.max_abs(), 0.0);

    const FixedPointResult again = stepper.solve_slice(s, beam, s.xi_step, &first.fields);
    ASSERT_TRUE(again.converged());
    const double scale = std::max(1.0, first.fields.max_abs());
    EXPECT_LT(max_abs_diff(again.fields, first.fields), 10.0 * g.tolerance * scale);

    // solve_slice leaves the stepper alone
    EXPECT_EQ(stepper.state().xi_index, 4);
}

TEST(XiStepper, PositiveBunchDrivesNegativeOnAxisEz) {
    XiStepper stepper(small_beam_config());
    const int c = stepper.grid().steps() / 2;

    double ez_min = 0.0;
    while (!stepper.finished()) {
        stepper.step();
        const FieldSet &f = stepper.state().fields;
        ASSERT_TRUE(std::isfinite(f.max_abs()));
        ez_min = std::min(ez_min, f.Ez(c, c));
    }
    EXPECT_LT(ez_min, 0.0);
    EXPECT_GT(stepper.state().beam.census.size(), 0u);
}

TEST(XiStepper, WeakBunchFollowsLinearWakeTheory) {
    Garage g = small_plasma_config();
    g.grid_steps            = 81;
    g.plasma_padding_steps  = 5;
    g.reflect_padding_steps = 4;
    g.xi_step = 0.05;
    g.xi_end  = -4.0;
    g.beam_charge    = 1.0;
    g.beam_density   = 0.01;
    g.beam_sigma_r   = 0.5;
    g.beam_sigma_xi  = 0.5;
    g.beam_xi_center = -1.6;
    g.beam_pz        = 1000.0;
    g.beam_particles = 20000;
    g.beam_seed      = 7u;

    // on-axis Ez = -q nb0 R int f(xi') cos(xi - xi') dxi', R = a e^a E1(a), a = sigma_r^2 / 2
    const double a = 0.5 * g.beam_sigma_r * g.beam_sigma_r;
    const double R = a * std::exp(a) * exp_integral_e1(a);
    ASSERT_NEAR(R, 0.2299, 1e-3);

    XiStepper stepper(g);
    const int c = stepper.grid().steps() / 2;
    std::vector<double> sim, lin;
    while (!stepper.finished()) {
        stepper.step();
        const double xi = stepper.state().xi;
        sim.push_back(stepper.state().fields.Ez(c, c));
        lin.push_back(-g.beam_charge * g.beam_density * R *
                      wake_integral(xi, g.beam_xi_center, g.beam_sigma_xi, g.beam_cut_sigmas));
    }
    ASSERT_GE(sim.size(), 80u);
    EXPECT_NEAR(stepper.state().xi, -4.0, 1e-9);

    double max_sim = 0.0, max_lin = 0.0;
    double ms = 0.0, ml = 0.0;
    for (size_t k = 0; k < sim.size(); ++k) {
        max_sim = std::max(max_sim, std::abs(sim[k]));
        max_lin = std::max(max_lin, std::abs(lin[k]));
        ms += sim[k];
        ml += lin[k];
    }
    ms /= sim.size();
    ml /= lin.size();
    double sl = 0.0, ss = 0.0, ll = 0.0;
    for (size_t k = 0; k < sim.size(); ++k) {
        sl += (sim[k] - ms) * (lin[k] - ml);
        ss += (sim[k] - ms) * (sim[k] - ms);
        ll += (lin[k] - ml) * (lin[k] - ml);
    }
    const double corr = sl / std::sqrt(ss * ll);

    EXPECT_NEAR(max_sim / max_lin, 1.0, 0.15) << "sim " << max_sim << " lin " << max_lin;
    EXPECT_GT(corr, 0.95);
}

TEST(XiStepper, NonConvergenceRetriesThenFails) {
    Garage g = small_beam_config();
    g.max_iterations = 1;
    g.min_iterations = 1;
    g.tolerance      = 1e-12;
    g.min_xi_step    = 0.025;
    g.max_retries    = 1;
    XiStepper stepper(g);

    EXPECT_THROW(stepper.run(nullptr, SliceObserver()), NonConvergenceError);
    // 0.1 -> 0.05 -> 0.025, then max_retries + 1 failures at the minimum
    EXPECT_GE(stepper.retries(), 4);
}

TEST(XiStepper, ObserverRunsAtTheCadenceAndAtTheEnd) {
    Garage g = small_plasma_config();
    g.xi_end = -0.5;
    g.diagnostics_each_n_slices = 2;
    XiStepper stepper(g);

    std::vector<int> seen;
    EXPECT_TRUE(stepper.run(nullptr, [&](const SimulationState& s) { seen.push_back(s.xi_index); }));
    EXPECT_EQ(seen, (std::vector<int>{2, 4, 5}));
}

TEST(XiStepper, EverySliceHookRunsBeforeTheCadencedObserver) {
    Garage g = small_plasma_config();
    g.xi_end = -0.5;
    g.diagnostics_each_n_slices = 2;
    XiStepper stepper(g);

    std::vector<int> order;
    EXPECT_TRUE(stepper.run(nullptr,
                            [&](const SimulationState& s) { order.push_back(-s.xi_index); },
                            [&](const SimulationState& s) { order.push_back(s.xi_index); }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, -2, 3, 4, -4, 5, -5}));
}

TEST(XiStepper, ZeroCadenceObservesTheLastSliceOnly) {
    XiStepper stepper(small_plasma_config());
    ASSERT_EQ(stepper.settings().diagnostics_each_n_slices, 0);

    std::vector<int> seen;
    int slices = 0;
    EXPECT_TRUE(stepper.run(nullptr,
                            [&](const SimulationState& s) { seen.push_back(s.xi_index); },
                            [&](const SimulationState&) { ++slices; }));
    EXPECT_EQ(slices, 4);
    EXPECT_EQ(seen, (std::vector<int>{4}));
}

TEST(XiStepper, StopFlagInterruptsBetweenSlices) {
    XiStepper stepper(small_plasma_config());
    std::atomic<bool> stop{true};
    EXPECT_FALSE(stepper.run(&stop, SliceObserver()));
    EXPECT_EQ(stepper.state().xi_index, 0);
}

TEST(XiStepper, RestoreRejectsAnotherGrid) {
    XiStepper stepper(small_plasma_config());
    Garage other = small_plasma_config();
    other.grid_steps = 43;
    XiStepper bigger(other);
    EXPECT_THROW(stepper.restore(bigger.state()), ConfigurationError);
}

TEST(XiStepper, RestoreRejectsIonsTheConfigurationDoesNotMove) {
    Garage mobile = small_plasma_config();
    mobile.ion_mode = "mobile";
    XiStepper with_ions(mobile);
    ASSERT_FALSE(with_ions.state().ions.coarse.empty());

    XiStepper immobile(small_plasma_config());
    EXPECT_THROW(immobile.restore(with_ions.state()), ConfigurationError);
    EXPECT_NO_THROW(immobile.restore(XiStepper(small_plasma_config()).state()));
}

TEST(XiStepper, ParseFineRefresh) {
    EXPECT_EQ(parse_fine_refresh("per_iteration"), FineRefresh::PerIteration);
    EXPECT_EQ(parse_fine_refresh("per_slice"), FineRefresh::PerSlice);
    EXPECT_THROW(parse_fine_refresh("never"), ConfigurationError);
}
