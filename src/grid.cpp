#include "grid.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>


Grid::Grid(int steps, double step_size)
    : n_(steps), h_(step_size), x0_(-(steps / 2) * step_size) {
    if (steps < 3) throw std::invalid_argument("Grid: need at least 3 nodes per axis.");
    if (!(step_size > 0.0)) throw std::invalid_argument("Grid: step size must be > 0.");
}

bool Grid::contains(double x, double y) const {
    // NaN compares false and is rejected here too
    return x >= extent_lo() && x <= extent_hi() &&
           y >= extent_lo() && y <= extent_hi();
}

std::pair<int,int> Grid::cell_index(double x, double y) const {
    if (!contains(x, y)) throw OutOfDomainError(x, y);
    int i = static_cast<int>(std::floor((x - x0_) / h_ + 0.5));
    int j = static_cast<int>(std::floor((y - x0_) / h_ + 0.5));
    // the upper edge rounds onto the last node
    i = std::min(i, n_ - 1);
    j = std::min(j, n_ - 1);
    return {i, j};
}

// 1D quadratic weights for offset `loc` in [-0.5, 0.5) from the nearest node
static inline void quadratic_weights(double loc, double w[3]) {
    w[0] = 0.5 * (0.5 - loc) * (0.5 - loc);
    w[1] = 0.75 - loc * loc;
    w[2] = 0.5 * (0.5 + loc) * (0.5 + loc);
}

Stencil Grid::interpolation_weights(double x, double y) const {
    const std::pair<int,int> c = cell_index(x, y);
    Stencil s;

    const double loc_x = (x - x0_) / h_ - c.first;
    const double loc_y = (y - x0_) / h_ - c.second;
    quadratic_weights(loc_x, s.wx);
    quadratic_weights(loc_y, s.wy);

    for (int a = 0; a < 3; ++a) {
        s.ix[a] = std::clamp(c.first  + a - 1, 0, n_ - 1);
        s.iy[a] = std::clamp(c.second + a - 1, 0, n_ - 1);
    }
    return s;
}

double Grid::interpolate(const Field2D& f, const Stencil& s) const {
    double v = 0.0;
    for (int a = 0; a < 3; ++a) {
        for (int b = 0; b < 3; ++b) {
            v += f(s.ix[a], s.iy[b]) * (s.wx[a] * s.wy[b]);
        }
    }
    return v;
}

void Grid::deposit(Field2D& f, const Stencil& s, double value) const {
    for (int a = 0; a < 3; ++a) {
        for (int b = 0; b < 3; ++b) {
            f(s.ix[a], s.iy[b]) += value * (s.wx[a] * s.wy[b]);
        }
    }
}
