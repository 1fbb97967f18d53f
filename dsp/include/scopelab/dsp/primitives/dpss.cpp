// ==============================================================================
// Layer 1: DSP Primitive - Discrete Prolate Spheroidal Sequences (implementation)
// ==============================================================================

#include <scopelab/dsp/primitives/dpss.h>

#include <scopelab/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace Scopelab::DSP {

namespace {

constexpr int kBisectionIterations = 200;
constexpr int kInverseIterations = 4;

/// Tridiagonal matrix: diagonal d[0..n), off-diagonal e[1..n) (e[0] unused)
struct Tridiagonal {
    std::vector<double> diag;
    std::vector<double> off;
};

Tridiagonal buildDpssMatrix(size_t m, double halfBandwidth) {
    Tridiagonal t;
    t.diag.resize(m);
    t.off.assign(m, 0.0);

    const double w = halfBandwidth / static_cast<double>(m);
    const double cosTerm = std::cos(kTwoPi * w);
    for (size_t i = 0; i < m; ++i) {
        const double c = (static_cast<double>(m) - 1.0 - 2.0 * static_cast<double>(i)) * 0.5;
        t.diag[i] = c * c * cosTerm;
    }
    for (size_t i = 1; i < m; ++i) {
        t.off[i] = static_cast<double>(i) * static_cast<double>(m - i) * 0.5;
    }
    return t;
}

/// Number of eigenvalues strictly below x (Sturm sequence count)
size_t countBelow(const Tridiagonal& t, double x) noexcept {
    const size_t n = t.diag.size();
    const double tiny = std::numeric_limits<double>::min();
    size_t count = 0;
    double q = t.diag[0] - x;
    if (q < 0.0) ++count;
    for (size_t i = 1; i < n; ++i) {
        if (std::abs(q) < tiny) q = tiny;
        q = t.diag[i] - x - (t.off[i] * t.off[i]) / q;
        if (q < 0.0) ++count;
    }
    return count;
}

/// k-th smallest eigenvalue (0-based) by bisection inside the Gershgorin interval
double eigenvalueByIndex(const Tridiagonal& t, size_t index) noexcept {
    const size_t n = t.diag.size();
    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    for (size_t i = 0; i < n; ++i) {
        const double radius = std::abs(t.off[i]) + ((i + 1 < n) ? std::abs(t.off[i + 1]) : 0.0);
        lo = std::min(lo, t.diag[i] - radius);
        hi = std::max(hi, t.diag[i] + radius);
    }

    for (int iter = 0; iter < kBisectionIterations; ++iter) {
        const double mid = 0.5 * (lo + hi);
        if (mid <= lo || mid >= hi) break;
        if (countBelow(t, mid) > index) {
            hi = mid;
        } else {
            lo = mid;
        }
    }
    return 0.5 * (lo + hi);
}

/// Solve (T - shift*I) x = rhs in place (Gaussian elimination, partial pivoting)
void solveShifted(const Tridiagonal& t, double shift, std::vector<double>& rhs) {
    const size_t n = t.diag.size();
    std::vector<double> d(n);
    std::vector<double> dl(n, 0.0);  // sub-diagonal, reused as 2nd super-diagonal
    std::vector<double> du(n, 0.0);

    double scale = 0.0;
    for (size_t i = 0; i < n; ++i) {
        d[i] = t.diag[i] - shift;
        scale = std::max(scale, std::abs(t.diag[i]) + std::abs(t.off[i]));
    }
    for (size_t i = 0; i + 1 < n; ++i) {
        dl[i] = t.off[i + 1];
        du[i] = t.off[i + 1];
    }
    const double pivotFloor = std::max(scale, 1.0) * std::numeric_limits<double>::epsilon();

    for (size_t i = 0; i + 1 < n; ++i) {
        if (std::abs(d[i]) >= std::abs(dl[i])) {
            if (std::abs(d[i]) < pivotFloor) d[i] = pivotFloor;
            const double fact = dl[i] / d[i];
            d[i + 1] -= fact * du[i];
            rhs[i + 1] -= fact * rhs[i];
            dl[i] = 0.0;
        } else {
            const double fact = d[i] / dl[i];
            d[i] = dl[i];
            const double temp = d[i + 1];
            d[i + 1] = du[i] - fact * temp;
            if (i + 2 < n) {
                dl[i] = du[i + 1];
                du[i + 1] = -fact * dl[i];
            } else {
                dl[i] = 0.0;
            }
            du[i] = temp;
            const double r = rhs[i];
            rhs[i] = rhs[i + 1];
            rhs[i + 1] = r - fact * rhs[i + 1];
        }
    }
    if (std::abs(d[n - 1]) < pivotFloor) d[n - 1] = pivotFloor;

    rhs[n - 1] /= d[n - 1];
    if (n >= 2) {
        rhs[n - 2] = (rhs[n - 2] - du[n - 2] * rhs[n - 1]) / d[n - 2];
    }
    for (size_t i = n - 2; i-- > 0;) {
        rhs[i] = (rhs[i] - du[i] * rhs[i + 1] - dl[i] * rhs[i + 2]) / d[i];
    }
}

void normalize(std::vector<double>& v) noexcept {
    double norm = 0.0;
    for (double x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (double& x : v) x /= norm;
    }
}

void fixSign(std::vector<double>& v, size_t order) noexcept {
    bool flip = false;
    if (order % 2 == 0) {
        double sum = 0.0;
        for (double x : v) sum += x;
        flip = sum < 0.0;
    } else {
        double peak = 0.0;
        for (double x : v) peak = std::max(peak, std::abs(x));
        const double threshold = peak * 1e-7;
        for (double x : v) {
            if (std::abs(x) > threshold) {
                flip = x < 0.0;
                break;
            }
        }
    }
    if (flip) {
        for (double& x : v) x = -x;
    }
}

} // anonymous namespace

std::vector<std::vector<double>> computeDpss(size_t length, double halfBandwidth,
                                             size_t numTapers, bool symmetric) {
    std::vector<std::vector<double>> tapers;
    if (length == 0 || numTapers == 0) return tapers;

    const size_t m = symmetric ? length : length + 1;
    numTapers = std::min(numTapers, m);

    if (m == 1) {
        tapers.emplace_back(length, 1.0);
        return tapers;
    }

    const Tridiagonal t = buildDpssMatrix(m, halfBandwidth);
    tapers.reserve(numTapers);

    for (size_t k = 0; k < numTapers; ++k) {
        const double lambda = eigenvalueByIndex(t, m - 1 - k);
        const double shift = lambda + std::abs(lambda) * 1e-12 + 1e-12;

        std::vector<double> v(m);
        for (size_t i = 0; i < m; ++i) {
            v[i] = 1.0 + 0.01 * static_cast<double>((i * 7919u + k * 104729u) % 101u) / 101.0;
        }

        for (int iter = 0; iter < kInverseIterations; ++iter) {
            solveShifted(t, shift, v);
            for (const auto& prev : tapers) {
                double dot = 0.0;
                for (size_t i = 0; i < m; ++i) dot += prev[i] * v[i];
                for (size_t i = 0; i < m; ++i) v[i] -= dot * prev[i];
            }
            normalize(v);
        }

        fixSign(v, k);
        tapers.push_back(std::move(v));
    }

    if (!symmetric) {
        for (auto& taper : tapers) taper.resize(length);
    }
    return tapers;
}

} // namespace Scopelab::DSP
