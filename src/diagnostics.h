#pragma once
#include <string>
#include <vector>

#include "garage.h"
#include "grid.h"
#include "loop.h"
#include "utilities.h"

// Separable Gaussian filter with sigma in cells, mirrored edges
// (d c b a | a b c d), kernel truncated at 4 sigma.
Field2D gaussian_blur(const Field2D& f, double sigma);

// High-frequency noise of the charge density: mean |ro - blur(ro)| with a
// 0.25 c/omega_p blur, in units of the reference level 4.23045376e-04.
double zn_metric(const Field2D& ro, double step_size);

// Strict interior local maxima of a sequence
std::vector<size_t> local_maxima(const std::vector<double>& v);

// Per-slice run diagnostics: on-axis Ez history, wake peak tracking, the
// ro noise metric and the beam energy spectrum.
class Diagnostics {
public:
    Diagnostics(const Garage& g, const Grid& grid);

    // Call after every slice.
    void record(const SimulationState& s);

    // Census particles already present (a resumed run) are not tallied again
    void skip_census(size_t n) { census_seen_ = n; }

    // "<last peak> <deviation from the first peak>%", or "..." before the first peak
    std::string peak_report() const;

    // Console line: xi=<xi> <Ez_00>|<peak report>|zn=<max zn>
    std::string line() const;

    const std::vector<double>& xi_history() const   { return xi_history_; }
    const std::vector<double>& ez_00_history() const { return ez_00_history_; }
    double max_zn() const { return max_zn_; }
    const Tally& beam_spectrum() const { return spectrum_; }

private:
    const Grid& grid_;
    std::vector<double> xi_history_;
    std::vector<double> ez_00_history_;
    double max_zn_ = 0.0;
    Tally  spectrum_;
    size_t census_seen_ = 0;
};
