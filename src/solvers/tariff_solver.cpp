#include <lw/solvers/tariff_solver.hpp>
#include <lw/solvers/debt_sizing.hpp>
#include <lw/finance/irr.hpp>
#include <lw/core/errors.hpp>

#include <cmath>
#include <functional>
#include <limits>
#include <sstream>
#include <utility>

namespace {

// Tableau candidat à un tarif donné (+ dette bornée à 1 ?)
struct Candidate {
  lw::cashflow::Schedule schedule;
  bool capped;
};

using Builder = std::function<Candidate(double)>;

lw::solvers::TariffResult solve_impl(const lw::project::Assumptions& a,
                                     const Builder& build,
                                     const lw::config::SolverConfig& cfg) {
  const double ke = a.cost_of_equity;
  auto g = [&](double t) { return lw::solvers::equity_irr(build(t).schedule) - ke; };

  // Point d’évaluation de l’encadrement : IRR indéfini si aucun apport equity
  struct BracketPoint {
    bool no_equity;
    lw::finance::IrrResult irr;
  };
  auto evaluate = [&](double t) {
    const Candidate c = build(t);
    return BracketPoint{c.schedule.rows.front().equity_cashflow == 0.0,
                        lw::finance::irr(c.schedule.equity_cashflows())};
  };
  auto above = [&](const BracketPoint& p) { return p.irr.converged && p.irr.rate > ke; };

  const double t_be = lw::solvers::breakeven_ebitda_tariff(a);
  const double step = a.capital_cost() / (a.annual_energy_mwh() * a.project_lifetime_years);

  // Encadrement : borne haute doublée jusqu’à IRR > cost_of_equity
  double prev = t_be;
  double hi = t_be + step;
  BracketPoint pt_hi = evaluate(hi);
  int k = 0;
  while (!pt_hi.no_equity && !above(pt_hi) && k < cfg.max_bracket_expansions) {
    ++k;
    prev = hi;
    hi = t_be + step * std::ldexp(1.0, k);
    pt_hi = evaluate(hi);
  }

  // Dette à 100 % au-delà d’un seuil : on cherche sous ce seuil un tarif
  // dont l’IRR est défini et au-dessus de la cible
  if (pt_hi.no_equity) {
    bool found = false;
    double lo = prev;
    for (int i = 0; i < cfg.max_iterations && !found; ++i) {
      const double mid = 0.5 * (lo + hi);
      if (!(mid > lo && mid < hi)) break;
      const BracketPoint pt_mid = evaluate(mid);
      if (pt_mid.no_equity) {
        hi = mid;
      } else if (above(pt_mid)) {
        hi = mid;
        pt_hi = pt_mid;
        found = true;
      } else {
        lo = mid;
      }
    }
    if (!found) {
      std::ostringstream msg;
      msg << "solve_tariff: equity IRR target " << ke
          << " not bracketed, equity investment vanishes (100 % debt) from tariff " << hi;
      throw lw::NonConvergenceError("tariff", msg.str(), std::numeric_limits<double>::quiet_NaN(), k);
    }
  }
  const double g_hi = pt_hi.irr.rate - ke;
  if (!above(pt_hi)) {
    std::ostringstream msg;
    msg << "solve_tariff: equity IRR target " << ke << " not bracketed up to tariff " << hi;
    throw lw::NonConvergenceError("tariff", msg.str(), g_hi, k);
  }

  const auto root = lw::core::find_root_bracketed(g,
                                                  t_be, -std::numeric_limits<double>::infinity(),
                                                  hi, g_hi,
                                                  0.5 * (t_be + hi), cfg);
  if (!root.converged) {
    std::ostringstream msg;
    msg << "solve_tariff: no convergence after " << root.iters
        << " iterations (residual " << root.residual << ", tolerance " << cfg.tolerance << ")";
    throw lw::NonConvergenceError("tariff", msg.str(), root.residual, root.iters);
  }

  Candidate fin = build(root.x);
  const auto irr = lw::finance::irr(fin.schedule.equity_cashflows());
  if (!irr.converged) {
    throw lw::NonConvergenceError("tariff", "solve_tariff: equity IRR undefined at solved tariff",
                                  root.residual, root.iters);
  }

  lw::solvers::TariffResult out{};
  out.tariff        = root.x;
  out.equity_irr    = irr.rate;
  out.debt_fraction = fin.schedule.debt_fraction;
  out.debt_capped   = fin.capped;
  out.residual      = root.residual;
  out.iters         = root.iters;
  out.converged     = true;
  out.schedule      = std::move(fin.schedule);
  out.log           = root.log;
  return out;
}

} // namespace

namespace lw {
namespace solvers {

double breakeven_ebitda_tariff(const lw::project::Assumptions& a) noexcept {
  return a.o_m_cost_pct_of_capital_cost * a.capital_cost() / a.annual_energy_mwh();
}

double equity_irr(const lw::cashflow::Schedule& s) {
  return lw::finance::irr(s.equity_cashflows()).rate;
}

TariffResult solve_tariff(const lw::project::Assumptions& a,
                          double debt_fraction,
                          const lw::config::SolverConfig& cfg) {
  Builder build = [&](double t) {
    return Candidate{lw::cashflow::generate(a, t, debt_fraction), false};
  };
  return solve_impl(a, build, cfg);
}

TariffResult solve_tariff_sizing_debt(const lw::project::Assumptions& a,
                                      const lw::config::SolverConfig& debt_cfg,
                                      const lw::config::SolverConfig& tariff_cfg) {
  // Chaque tarif candidat relance un dimensionnement DSCR indépendant
  Builder build = [&](double t) {
    auto sized = size_debt(a, t, debt_cfg);
    return Candidate{std::move(sized.schedule), sized.capped};
  };
  return solve_impl(a, build, tariff_cfg);
}

} // namespace solvers
} // namespace lw
