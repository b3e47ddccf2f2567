#include "lw/core/root_finding.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <limits>

int main() {
  const double INF = std::numeric_limits<double>::infinity();

  // 1) Fonction croissante, encadrement classique : racine de x^2 - 2 sur [0, 2]
  {
    lw::config::SolverConfig cfg(100, 1e-12);
    auto f = [](double x) { return x * x - 2.0; };
    const auto r = lw::core::find_root_bracketed(f, 0.0, f(0.0), 2.0, f(2.0), 1.0, cfg);
    assert(r.converged);
    assert(std::abs(r.x - std::sqrt(2.0)) < 1e-10);
    assert(std::abs(r.residual) <= 1e-12);
    assert(r.log.empty()); // journal désactivé par défaut
  }

  // 2) Fonction décroissante avec sentinelle +inf en borne basse (type DSCR sans dette)
  {
    lw::config::SolverConfig cfg(100, 1e-10, 60, /*record_log=*/true);
    auto f = [](double x) { return 1.0 / x - 2.0; };
    const auto r = lw::core::find_root_bracketed(f, 0.0, INF, 1.0, f(1.0), 0.9, cfg);
    assert(r.converged);
    assert(std::abs(r.x - 0.5) < 1e-9);
    assert(static_cast<int>(r.log.size()) == r.iters);
    assert(r.log.back().x == r.x);
    assert(r.log.front().iter == 1);
  }

  // 3) Résidu qui saute (+inf au-delà d’un seuil) : bisection de secours
  {
    lw::config::SolverConfig cfg(200, 1e-8);
    auto f = [&](double x) { return x > 3.0 ? INF : x - 2.5; };
    const auto r = lw::core::find_root_bracketed(f, 0.0, -INF, 10.0, INF, 5.0, cfg);
    assert(r.converged);
    assert(std::abs(r.x - 2.5) < 1e-8);
  }

  // 4) Budget épuisé → non convergé, dernier point rapporté
  {
    lw::config::SolverConfig cfg(1, 1e-12);
    auto f = [](double x) { return x * x - 2.0; };
    const auto r = lw::core::find_root_bracketed(f, 0.0, -2.0, 2.0, 2.0, 1.0, cfg);
    assert(!r.converged);
    assert(r.iters == 1);
    assert(r.x == 1.0);
    assert(r.residual == -1.0);
  }

  // 5) Pas d’encadrement (même signe) → rien n’est tenté
  {
    lw::config::SolverConfig cfg;
    int calls = 0;
    auto f = [&](double x) { ++calls; return x * x + 1.0; };
    const auto r = lw::core::find_root_bracketed(f, -1.0, 2.0, 1.0, 2.0, 0.0, cfg);
    assert(!r.converged);
    assert(r.iters == 0);
    assert(calls == 0);
  }

  std::cout << "Root finder OK.\n";
  return 0;
}
