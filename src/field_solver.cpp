#include "field_solver.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <stdexcept>
#include <string>


double FieldSet::max_abs() const {
    return std::max({Ex.max_abs(), Ey.max_abs(), Ez.max_abs(),
                     Bx.max_abs(), By.max_abs(), Bz.max_abs()});
}

double max_abs_diff(const FieldSet& a, const FieldSet& b) {
    return std::max({max_abs_diff(a.Ex, b.Ex), max_abs_diff(a.Ey, b.Ey),
                     max_abs_diff(a.Ez, b.Ez), max_abs_diff(a.Bx, b.Bx),
                     max_abs_diff(a.By, b.By), max_abs_diff(a.Bz, b.Bz)});
}

static Field2D mean_of(const Field2D& a, const Field2D& b) {
    Field2D out(a.n);
    for (size_t k = 0; k < out.data.size(); ++k) out.data[k] = 0.5 * (a.data[k] + b.data[k]);
    return out;
}

FieldSet average(const FieldSet& a, const FieldSet& b) {
    FieldSet out;
    out.Ex = mean_of(a.Ex, b.Ex);
    out.Ey = mean_of(a.Ey, b.Ey);
    out.Ez = mean_of(a.Ez, b.Ez);
    out.Bx = mean_of(a.Bx, b.Bx);
    out.By = mean_of(a.By, b.By);
    out.Bz = mean_of(a.Bz, b.Bz);
    return out;
}


// ------------------------------ transforms -----------------------------------

FieldSolver::Plan::~Plan() {
    if (plan) fftw_destroy_plan(plan);
    if (buf)  fftw_free(buf);
}

FieldSolver::FieldSolver(const Grid& grid, double subtraction_trick)
    : n_(grid.steps()), h_(grid.step_size()), s_(subtraction_trick), lambda_(grid.steps()) {
    const int M = n_ - 1;
    for (int k = 0; k < n_; ++k) {
        const double sk = std::sin(M_PI * k / (2.0 * M));
        lambda_[k] = 4.0 / (h_ * h_) * sk * sk;
    }

    const Boundary kinds[] = {Boundary::Neumann, Boundary::Dirichlet};
    for (Boundary bx : kinds) {
        for (Boundary by : kinds) {
            Plan &p = plans_[plan_index(bx, by)];
            p.off0 = (bx == Boundary::Dirichlet) ? 1 : 0;
            p.off1 = (by == Boundary::Dirichlet) ? 1 : 0;
            p.n0   = n_ - 2 * p.off0;
            p.n1   = n_ - 2 * p.off1;

            p.buf = fftw_alloc_real(static_cast<size_t>(p.n0) * p.n1);
            if (!p.buf) throw std::bad_alloc();

            // FFTW_ESTIMATE picks the same algorithm every run, so a resumed
            // run reproduces the round-off of an uninterrupted one
            p.plan = fftw_plan_r2r_2d(p.n0, p.n1, p.buf, p.buf,
                                      bx == Boundary::Neumann ? FFTW_REDFT00 : FFTW_RODFT00,
                                      by == Boundary::Neumann ? FFTW_REDFT00 : FFTW_RODFT00,
                                      FFTW_ESTIMATE);
            if (!p.plan) {
                throw std::runtime_error("FFTW could not plan a " + std::to_string(p.n0) + "x" +
                                         std::to_string(p.n1) + " r2r transform");
            }
        }
    }
}

Field2D FieldSolver::solve_helmholtz(const Field2D& rhs, Boundary bx, Boundary by, double s) const {
    const Plan &p = plans_[plan_index(bx, by)];

    for (int a = 0; a < p.n0; ++a)
        for (int b = 0; b < p.n1; ++b)
            p.buf[static_cast<size_t>(a) * p.n1 + b] = rhs(a + p.off0, b + p.off1);

    fftw_execute(p.plan);

    // both r2r kinds are their own inverse up to 2M per axis
    const double M = n_ - 1;
    const double norm = 1.0 / (4.0 * M * M);
    for (int a = 0; a < p.n0; ++a) {
        for (int b = 0; b < p.n1; ++b) {
            const double denom = lambda_[a + p.off0] + lambda_[b + p.off1] + s;
            double &c = p.buf[static_cast<size_t>(a) * p.n1 + b];
            // only the all-Neumann constant mode hits 0: zero-mean gauge
            c = (denom > 0.0) ? c * norm / denom : 0.0;
        }
    }

    fftw_execute(p.plan);

    Field2D out(n_);
    for (int a = 0; a < p.n0; ++a)
        for (int b = 0; b < p.n1; ++b)
            out(a + p.off0, b + p.off1) = p.buf[static_cast<size_t>(a) * p.n1 + b];
    return out;
}

Field2D FieldSolver::laplacian(const Field2D& f, Boundary bx, Boundary by) const {
    const int N = n_;
    const int M = N - 1;
    const double inv_h2 = 1.0 / (h_ * h_);
    Field2D out(N);

    for (int i = 0; i < N; ++i) {
        if (bx == Boundary::Dirichlet && (i == 0 || i == M)) continue;
        const int im = (i == 0) ? 1 : i - 1;      // mirrored ghost for Neumann
        const int ip = (i == M) ? M - 1 : i + 1;
        for (int j = 0; j < N; ++j) {
            if (by == Boundary::Dirichlet && (j == 0 || j == M)) continue;
            const int jm = (j == 0) ? 1 : j - 1;
            const int jp = (j == M) ? M - 1 : j + 1;
            out(i, j) = (f(im, j) + f(ip, j) + f(i, jm) + f(i, jp) - 4.0 * f(i, j)) * inv_h2;
        }
    }
    return out;
}

Field2D FieldSolver::d_dx(const Field2D& f) const {
    Field2D out(n_);
    const double inv_2h = 0.5 / h_;
    for (int i = 1; i < n_ - 1; ++i)
        for (int j = 0; j < n_; ++j)
            out(i, j) = (f(i + 1, j) - f(i - 1, j)) * inv_2h;
    return out;
}

Field2D FieldSolver::d_dy(const Field2D& f) const {
    Field2D out(n_);
    const double inv_2h = 0.5 / h_;
    for (int i = 0; i < n_; ++i)
        for (int j = 1; j < n_ - 1; ++j)
            out(i, j) = (f(i, j + 1) - f(i, j - 1)) * inv_2h;
    return out;
}


// ------------------------------- fields --------------------------------------

FieldSet FieldSolver::solve(const SourceTerms& sources, const SourceTerms& prev,
                            const FieldSet& guess, double xi_step) const {
    const int N = n_;
    const size_t NN = static_cast<size_t>(N) * N;

    const Field2D dro_dx = d_dx(sources.ro);
    const Field2D dro_dy = d_dy(sources.ro);
    const Field2D djz_dx = d_dx(sources.jz);
    const Field2D djz_dy = d_dy(sources.jz);

    Field2D djx_dxi(N), djy_dxi(N);
    for (size_t k = 0; k < NN; ++k) {
        djx_dxi.data[k] = (prev.jx.data[k] - sources.jx.data[k]) / xi_step;
        djy_dxi.data[k] = (prev.jy.data[k] - sources.jy.data[k]) / xi_step;
    }

    // (Lap - s) F = R  is solved as  (-Lap + s) F = -R
    Field2D ex_rhs(N), ey_rhs(N), bx_rhs(N), by_rhs(N);
    for (size_t k = 0; k < NN; ++k) {
        ex_rhs.data[k] = -(dro_dx.data[k] - djx_dxi.data[k]) + s_ * guess.Ex.data[k];
        ey_rhs.data[k] = -(dro_dy.data[k] - djy_dxi.data[k]) + s_ * guess.Ey.data[k];
        bx_rhs.data[k] = +(djz_dy.data[k] - djy_dxi.data[k]) + s_ * guess.Bx.data[k];
        by_rhs.data[k] = -(djz_dx.data[k] - djx_dxi.data[k]) + s_ * guess.By.data[k];
    }

    FieldSet out;
    out.Ex = solve_helmholtz(ex_rhs, Boundary::Neumann,   Boundary::Dirichlet, s_);
    out.Ey = solve_helmholtz(ey_rhs, Boundary::Dirichlet, Boundary::Neumann,   s_);
    out.Bx = solve_helmholtz(bx_rhs, Boundary::Dirichlet, Boundary::Neumann,   s_);
    out.By = solve_helmholtz(by_rhs, Boundary::Neumann,   Boundary::Dirichlet, s_);

    // Lap Ez = djx/dx + djy/dy, Lap Bz = djx/dy - djy/dx
    const Field2D djx_dx = d_dx(sources.jx);
    const Field2D djx_dy = d_dy(sources.jx);
    const Field2D djy_dx = d_dx(sources.jy);
    const Field2D djy_dy = d_dy(sources.jy);

    Field2D ez_rhs(N), bz_rhs(N);
    for (size_t k = 0; k < NN; ++k) {
        ez_rhs.data[k] = -(djx_dx.data[k] + djy_dy.data[k]);
        bz_rhs.data[k] = -(djx_dy.data[k] - djy_dx.data[k]);
    }
    out.Ez = solve_helmholtz(ez_rhs, Boundary::Dirichlet, Boundary::Dirichlet, 0.0);
    out.Bz = solve_helmholtz(bz_rhs, Boundary::Neumann,   Boundary::Neumann,   0.0);
    return out;
}
