#pragma once
#include <utility>

#include "utilities.h"

// Nine-node quadratic-spline stencil around the nearest node.
// Node (ix[a], iy[b]) carries weight wx[a] * wy[b]; a,b = 0,1,2 for offsets -1,0,+1.
// Indices beyond the mesh are folded onto the edge node, so the weights always sum to 1.
struct Stencil {
    int    ix[3];
    int    iy[3];
    double wx[3];
    double wy[3];
};

// Transverse mesh: N x N nodes, node i at (i - N/2) h. Immutable for the run.
class Grid {
public:
    Grid(int steps, double step_size);

    int    steps()     const { return n_; }
    double step_size() const { return h_; }
    double origin()    const { return x0_; }                      // position of node 0
    double node_position(int i) const { return x0_ + i * h_; }
    double extent_lo() const { return x0_; }
    double extent_hi() const { return x0_ + (n_ - 1) * h_; }
    double cell_area() const { return h_ * h_; }

    bool contains(double x, double y) const;

    // Nearest node; throws OutOfDomainError outside the extent.
    std::pair<int,int> cell_index(double x, double y) const;

    // Quadratic shape-function weights; throws OutOfDomainError outside the extent.
    Stencil interpolation_weights(double x, double y) const;

    double interpolate(const Field2D& f, const Stencil& s) const;
    void   deposit(Field2D& f, const Stencil& s, double value) const;

private:
    int    n_;
    double h_;
    double x0_;
};
