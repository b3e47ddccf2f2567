#include <lw/solvers/debt_sizing.hpp>
#include <lw/core/errors.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace lw {
namespace solvers {

DebtSizingResult size_debt(const lw::project::Assumptions& a,
                           double tariff,
                           const lw::config::SolverConfig& cfg) {
  const double target = a.dcsr;
  auto residual = [&](double d) {
    return lw::cashflow::min_dscr(lw::cashflow::generate(a, tariff, d)) - target;
  };

  DebtSizingResult out{};

  // 100 % dette : si la cible tient encore, on borne à 1
  auto full = lw::cashflow::generate(a, tariff, 1.0);
  const double f1 = lw::cashflow::min_dscr(full) - target;
  if (f1 >= 0.0) {
    out.debt_fraction = 1.0;
    out.min_dscr      = f1 + target;
    out.residual      = f1;
    out.iters         = 1;
    out.converged     = true;
    out.capped        = true;
    out.schedule      = std::move(full);
    if (cfg.record_log) out.log.push_back({1, 1.0, f1});
    return out;
  }

  // EBITDA <= 0 : DSCR <= 0 pour toute dette > 0, pas de racine dans ]0,1]
  const double ebitda = a.annual_energy_mwh() * tariff - a.o_m_cost_pct_of_capital_cost * a.capital_cost();
  if (!(ebitda > 0.0)) {
    std::ostringstream msg;
    msg << "size_debt: target DSCR " << target << " unreachable, EBITDA <= 0 at tariff " << tariff;
    throw lw::NonConvergenceError("dscr", msg.str(), f1, 0);
  }

  // f(0) = +inf (sentinelle, jamais évaluée)
  const auto root = lw::core::find_root_bracketed(residual,
                                                  0.0, std::numeric_limits<double>::infinity(),
                                                  1.0, f1,
                                                  0.5, cfg);
  if (!root.converged) {
    std::ostringstream msg;
    msg << "size_debt: no convergence after " << root.iters
        << " iterations (residual " << root.residual << ", tolerance " << cfg.tolerance << ")";
    throw lw::NonConvergenceError("dscr", msg.str(), root.residual, root.iters);
  }

  out.debt_fraction = root.x;
  out.residual      = root.residual;
  out.min_dscr      = root.residual + target;
  out.iters         = root.iters;
  out.converged     = true;
  out.capped        = false;
  out.schedule      = lw::cashflow::generate(a, tariff, root.x);
  out.log           = root.log;
  return out;
}

} // namespace solvers
} // namespace lw
