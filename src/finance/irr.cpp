#include "lw/finance/irr.hpp"
#include <cmath>
#include <algorithm>
#include <limits>

namespace {

// dNPV/drate = sum_t -t * cf[t] / (1+rate)^(t+1)
inline double npv_derivative(double rate, const std::vector<double>& cf) {
  const double g = 1.0 / (1.0 + rate);
  double disc = g; // (1+rate)^-(t+1) pour t = 0
  double d = 0.0;
  for (std::size_t t = 0; t < cf.size(); ++t) {
    d -= static_cast<double>(t) * cf[t] * disc;
    disc *= g;
  }
  return d;
}

struct SolveCfg {
  double rate_hi    = 1.0;    // doublé jusqu’à NPV < 0
  int    expand_max = 60;
  int    newton_max = 50;
  int    bisect_max = 200;
  double tol_npv    = 1e-12;  // tol. relative à max|cf|
  double tol_rate   = 1e-14;  // tol. absolue sur le taux
};

// Grille de départ sur ]-1, rate_hi[ (croissante)
constexpr double kRateGrid[] = {-0.99, -0.9, -0.75, -0.5, -0.25, 0.0, 0.1, 0.25, 0.5};

} // namespace

namespace lw::finance {

double npv(double rate, const std::vector<double>& cashflows) noexcept {
  const double g = 1.0 / (1.0 + rate);
  double disc = 1.0;
  double v = 0.0;
  for (double cf : cashflows) {
    v += cf * disc;
    disc *= g;
  }
  return v;
}

IrrResult irr(const std::vector<double>& cashflows) {
  SolveCfg cfg{};
  IrrResult out{std::numeric_limits<double>::quiet_NaN(), 0, false};
  if (cashflows.size() < 2) return out;

  double scale = 0.0;
  for (double cf : cashflows) scale = std::max(scale, std::fabs(cf));
  if (!(scale > 0.0) || !std::isfinite(scale)) return out;
  const double tol_v = cfg.tol_npv * scale;

  // Bracketing par balayage croissant : on garde le dernier passage
  // NPV > 0 → NPV < 0 (NPV(+inf) = cf[0], signe connu au-delà)
  double a = 0.0, b = 0.0;
  bool has_pos = false, has_neg = false, has_b = false;
  auto visit = [&](double rate) {
    const double v = npv(rate, cashflows);
    if (v > 0.0) { a = rate; has_pos = true; has_b = false; }
    else if (v < 0.0) {
      has_neg = true;
      if (has_pos && !has_b) { b = rate; has_b = true; }
    }
    return v;
  };
  for (double rate : kRateGrid) visit(rate);
  double hi = cfg.rate_hi;
  for (int k = 0; k <= cfg.expand_max; ++k, hi *= 2.0) {
    if (visit(hi) < 0.0 && has_b) break;
  }

  if (!has_pos) { out.rate = -1.0; return out; }                 // jamais rentable
  if (!has_b) {
    // NPV > 0 aux grands taux : +inf si jamais négative, indéfini sinon (aucun apport initial)
    out.rate = has_neg ? std::numeric_limits<double>::quiet_NaN()
                       : std::numeric_limits<double>::infinity();
    return out;
  }

  // Safeguarded Newton depuis 10 %
  double rate = (0.10 > a && 0.10 < b) ? 0.10 : 0.5 * (a + b);

  int it = 0;
  bool conv = false;
  for (; it < cfg.newton_max; ++it) {
    const double v = npv(rate, cashflows);
    if (std::fabs(v) <= tol_v) { conv = true; break; }

    if (v > 0.0) { a = rate; } else { b = rate; }

    const double d = npv_derivative(rate, cashflows);
    double rate_newton = std::numeric_limits<double>::quiet_NaN(); // forcera bisection
    if (std::fabs(d) > 1e-300) rate_newton = rate - v / d;

    if (std::isfinite(rate_newton) && rate_newton > a && rate_newton < b) {
      rate = rate_newton;
    } else {
      rate = 0.5 * (a + b);
    }

    if (std::fabs(b - a) < cfg.tol_rate) { conv = true; break; }
  }

  // Si non convergé en Newton → bisection pure
  if (!conv) {
    for (int k = 0; k < cfg.bisect_max; ++k, ++it) {
      rate = 0.5 * (a + b);
      const double v = npv(rate, cashflows);
      if (std::fabs(v) <= tol_v) { conv = true; break; }
      if (v > 0.0) { a = rate; } else { b = rate; }
      if (std::fabs(b - a) < cfg.tol_rate) { conv = true; break; }
    }
  }

  out.rate      = rate;
  out.iters     = it;
  out.converged = conv;
  return out;
}

} // namespace lw::finance
