#include "lw/core/root_finding.hpp"
#include <cmath>
#include <limits>

namespace lw::core {

RootResult find_root_bracketed(const std::function<double(double)>& f,
                               double a, double fa,
                               double b, double fb,
                               double x0,
                               const lw::config::SolverConfig& cfg)
{
  RootResult out{};
  out.x         = std::numeric_limits<double>::quiet_NaN();
  out.residual  = fb;
  out.iters     = 0;
  out.converged = false;

  // Pas un vrai encadrement → on ne tente rien (l’appelant lève)
  if (!(a < b) || std::isnan(fa) || std::isnan(fb) || ((fa < 0.0) == (fb < 0.0))) {
    return out;
  }

  // Orientation : f(a) < 0 (croissante) ou f(a) > 0 (décroissante)
  const bool neg_at_a = (fa < 0.0);

  double x = (x0 > a && x0 < b) ? x0 : 0.5 * (a + b);
  double x_prev = std::numeric_limits<double>::quiet_NaN();
  double f_prev = std::numeric_limits<double>::quiet_NaN();

  // largeurs d’encadrement 1 et 2 pas en arrière (garde-fou de réduction)
  double width_1 = b - a;
  double width_2 = b - a;

  for (int it = 1; it <= cfg.max_iterations; ++it) {
    const double fx = f(x);
    out.x        = x;
    out.residual = fx;
    out.iters    = it;
    if (cfg.record_log) out.log.push_back({it, x, fx});

    if (std::isfinite(fx) && std::fabs(fx) <= cfg.tolerance) { out.converged = true; break; }
    if (std::isnan(fx)) break; // résidu indéfini : inutile d’insister

    // Met à jour le bracket
    if ((fx < 0.0) == neg_at_a) { a = x; fa = fx; } else { b = x; fb = fx; }

    // Pas de sécante (deux derniers points), sinon fausse position sur [a, b]
    double xs = std::numeric_limits<double>::quiet_NaN();
    if (std::isfinite(fx) && std::isfinite(f_prev) && fx != f_prev) {
      xs = x - fx * (x - x_prev) / (fx - f_prev);
    } else if (std::isfinite(fa) && std::isfinite(fb) && fa != fb) {
      xs = a - fa * (b - a) / (fb - fa);
    }
    x_prev = x;
    f_prev = fx;

    // Safeguard : bracket pas réduit de moitié en deux pas ⇒ bisection
    const double width = b - a;
    const bool slow = width > 0.5 * width_2;
    width_2 = width_1;
    width_1 = width;

    if (std::isfinite(xs) && xs > a && xs < b && !slow) {
      x = xs;
    } else {
      x = 0.5 * (a + b);
    }

    // Encadrement épuisé en double précision
    if (!(x > a && x < b)) break;
  }

  return out;
}

} // namespace lw::core
