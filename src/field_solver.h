#pragma once
#include <array>
#include <vector>

#include <fftw3.h>

#include "deposition.h"
#include "grid.h"
#include "utilities.h"

// ---------- fields ----------
struct FieldSet {
    Field2D Ex, Ey, Ez;
    Field2D Bx, By, Bz;

    FieldSet() = default;
    explicit FieldSet(int n) : Ex(n), Ey(n), Ez(n), Bx(n), By(n), Bz(n) {}

    double max_abs() const;
};

// max |a - b| over all six components
double max_abs_diff(const FieldSet& a, const FieldSet& b);

// (a + b) / 2, component-wise
FieldSet average(const FieldSet& a, const FieldSet& b);


// ---------- solver ----------
// Boundary condition along one axis of a separable solve.
enum class Boundary { Neumann, Dirichlet };

// Transform-based solver for the quasi-static field equations on a fixed grid.
// Neumann axes use a DCT-I over all nodes, Dirichlet axes a DST-I over the
// interior nodes; both diagonalise the 5-point Laplacian exactly. The
// transforms are FFTW r2r plans made once per boundary pair. Plans share
// scratch buffers, so one solver must not be used from two threads at once.
class FieldSolver {
public:
    FieldSolver(const Grid& grid, double subtraction_trick);

    // Fields of one slice. `sources` are the totals seen by the fields
    // (plasma + ions + beam), `prev` the previous slice's sources (for
    // djx/dxi, djy/dxi) and `guess` the fields used by the subtraction trick.
    FieldSet solve(const SourceTerms& sources, const SourceTerms& prev,
                   const FieldSet& guess, double xi_step) const;

    // Solves (-Lap + s) f = rhs. Dirichlet edges are forced to 0 and the rhs
    // there is ignored. With s = 0 and Neumann on both axes the constant
    // mode is dropped (zero-mean gauge).
    Field2D solve_helmholtz(const Field2D& rhs, Boundary bx, Boundary by, double s) const;

    // 5-point Laplacian with the boundary treatment solve_helmholtz inverts
    // (mirrored ghost nodes for Neumann, zero edges for Dirichlet).
    Field2D laplacian(const Field2D& f, Boundary bx, Boundary by) const;

    // Central differences, zero on the edge nodes normal to the derivative
    Field2D d_dx(const Field2D& f) const;
    Field2D d_dy(const Field2D& f) const;

    double subtraction_trick() const { return s_; }

private:
    // In-place REDFT00/RODFT00 plan over the solvable block of one boundary
    // pair. Dirichlet axes drop the edge nodes.
    struct Plan {
        int off0 = 0, n0 = 0;  // x: first node, node count
        int off1 = 0, n1 = 0;  // y
        double*   buf  = nullptr;
        fftw_plan plan = nullptr;

        Plan() = default;
        Plan(const Plan&) = delete;
        Plan& operator=(const Plan&) = delete;
        ~Plan();
    };

    static int plan_index(Boundary bx, Boundary by) {
        return (bx == Boundary::Dirichlet ? 2 : 0) + (by == Boundary::Dirichlet ? 1 : 0);
    }

    int    n_;
    double h_;
    double s_;
    std::vector<double> lambda_;  // eigenvalues of -Lap along one axis, by mode
    std::array<Plan, 4> plans_;
};
