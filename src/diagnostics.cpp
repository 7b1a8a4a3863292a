#include "diagnostics.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>


// ------------------------------ ro noise -------------------------------------

// mirror an out-of-range index back into [0, n)
static int reflect_index(int i, int n) {
    while (i < 0 || i >= n) {
        if (i < 0)  i = -i - 1;
        if (i >= n) i = 2 * n - i - 1;
    }
    return i;
}

Field2D gaussian_blur(const Field2D& f, double sigma) {
    const int n = f.n;
    const int radius = static_cast<int>(4.0 * sigma + 0.5);

    std::vector<double> kernel(2 * radius + 1);
    double norm = 0.0;
    for (int k = -radius; k <= radius; ++k) {
        const double w = (sigma > 0.0) ? std::exp(-0.5 * k * k / (sigma * sigma)) : (k == 0 ? 1.0 : 0.0);
        kernel[k + radius] = w;
        norm += w;
    }
    for (auto &w : kernel) w /= norm;

    Field2D tmp(n), out(n);
    for (int i = 0; i < n; ++i)
        for (int j = 0; j < n; ++j) {
            double v = 0.0;
            for (int k = -radius; k <= radius; ++k) v += kernel[k + radius] * f(reflect_index(i + k, n), j);
            tmp(i, j) = v;
        }
    for (int i = 0; i < n; ++i)
        for (int j = 0; j < n; ++j) {
            double v = 0.0;
            for (int k = -radius; k <= radius; ++k) v += kernel[k + radius] * tmp(i, reflect_index(j + k, n));
            out(i, j) = v;
        }
    return out;
}

double zn_metric(const Field2D& ro, double step_size) {
    if (ro.size() == 0) return 0.0;
    const Field2D blurred = gaussian_blur(ro, 0.25 / step_size);
    double s = 0.0;
    for (size_t k = 0; k < ro.data.size(); ++k) s += std::abs(ro.data[k] - blurred.data[k]);
    return s / static_cast<double>(ro.size()) / 4.23045376e-04;
}

std::vector<size_t> local_maxima(const std::vector<double>& v) {
    std::vector<size_t> idx;
    for (size_t k = 1; k + 1 < v.size(); ++k) {
        if (v[k] > v[k - 1] && v[k] > v[k + 1]) idx.push_back(k);
    }
    return idx;
}


// ----------------------------- Diagnostics -----------------------------------

static Tally make_spectrum(const Garage& g) {
    const int xi_bins = std::max(g.xi_steps(), 1);
    const double xi_lo = std::min(g.xi_end, g.xi_start - 1e-12);
    const double pz0 = (g.beam_energy_mev > 0.0)
                     ? kinetic_energy_2_pz(g.beam_energy_mev, g.beam_mass)
                     : g.beam_pz;
    const double pz_hi = (pz0 > 0.0) ? 2.0 * pz0 : 1.0;

    TallyDim xi_dim;
    xi_dim.name  = "xi";
    xi_dim.edges = linear_edges(xi_lo, g.xi_start, xi_bins);
    TallyDim pz_dim;
    pz_dim.name  = "pz";
    pz_dim.edges = linear_edges(0.0, pz_hi, 200);
    return Tally::Make("beam_spectrum", {"beam"}, {xi_dim, pz_dim});
}

Diagnostics::Diagnostics(const Garage& g, const Grid& grid)
    : grid_(grid), spectrum_(make_spectrum(g)) {}

void Diagnostics::record(const SimulationState& s) {
    const int c = grid_.steps() / 2;
    xi_history_.push_back(s.xi);
    ez_00_history_.push_back(s.fields.Ez.size() ? s.fields.Ez(c, c) : 0.0);
    max_zn_ = std::max(max_zn_, zn_metric(s.sources.ro, grid_.step_size()));

    for (; census_seen_ < s.beam.census.size(); ++census_seen_) {
        const Particle &p = s.beam.census[census_seen_];
        spectrum_.add("beam", {{"xi", p.xi}, {"pz", p.pz}}, p.weight);
    }
}

std::string Diagnostics::peak_report() const {
    const std::vector<size_t> peaks = local_maxima(ez_00_history_);
    if (peaks.empty()) return "...";

    const double first = ez_00_history_[peaks.front()];
    const double last  = ez_00_history_[peaks.back()];
    std::ostringstream os;
    os << std::scientific << std::setprecision(4) << last << " "
       << std::fixed << std::showpos << std::setprecision(2) << 100.0 * (last / first - 1.0) << "%";
    return os.str();
}

std::string Diagnostics::line() const {
    std::ostringstream os;
    const double xi = xi_history_.empty() ? 0.0 : xi_history_.back();
    const double ez = ez_00_history_.empty() ? 0.0 : ez_00_history_.back();
    os << "xi=" << std::showpos << std::fixed << std::setprecision(4) << xi << " "
       << std::scientific << ez << std::noshowpos
       << "|" << peak_report()
       << "|zn=" << std::fixed << std::setprecision(3) << max_zn_;
    return os.str();
}
