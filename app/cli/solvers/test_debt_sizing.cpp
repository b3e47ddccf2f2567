#include "lw/solvers/debt_sizing.hpp"
#include "lw/solvers/tariff_solver.hpp"
#include "lw/core/errors.hpp"
#include <cmath>
#include <cassert>
#include <iostream>

static lw::project::AssumptionInputs example_inputs() {
  lw::project::AssumptionInputs in;
  in.capacity_mw                  = 30.0;
  in.capacity_factor              = 0.097;
  in.capital_expenditure_per_mw   = 670000.0;
  in.o_m_cost_pct_of_capital_cost = 0.02;
  in.cost_of_debt                 = 0.04;
  in.cost_of_equity               = 0.12;
  in.tax_rate                     = 0.25;
  in.project_lifetime_years       = 20;
  in.dcsr                         = 1.3;
  return in;
}

int main() {
  const lw::project::Assumptions a(example_inputs());

  // 1) Cas nominal : DSCR minimal ramené sur la cible
  {
    lw::config::SolverConfig cfg;
    cfg.record_log = true;
    const auto r = lw::solvers::size_debt(a, 81.39, cfg);
    assert(r.converged && !r.capped);
    assert(std::abs(r.debt_fraction - 0.870010) < 1e-4);
    assert(std::abs(r.min_dscr - 1.3) <= cfg.tolerance);
    assert(std::abs(r.residual) <= cfg.tolerance);
    assert(r.schedule.debt_fraction == r.debt_fraction);
    assert(std::abs(lw::cashflow::min_dscr(r.schedule) - r.min_dscr) < 1e-12);
    assert(static_cast<int>(r.log.size()) == r.iters);
    assert(r.iters > 0 && r.iters <= cfg.max_iterations);
  }

  // 2) Tarif élevé : la cible tient même à 100 % dette → bornée
  {
    const auto r = lw::solvers::size_debt(a, 500.0);
    assert(r.converged && r.capped);
    assert(r.debt_fraction == 1.0);
    assert(r.min_dscr >= 1.3);
    assert(r.iters == 1);
  }

  // 3) EBITDA négatif : pas de fraction de dette admissible
  {
    const double t = 0.5 * lw::solvers::breakeven_ebitda_tariff(a);
    bool threw = false;
    try { (void)lw::solvers::size_debt(a, t); }
    catch (const lw::NonConvergenceError& e) {
      threw = (e.solver() == "dscr") && e.iterations() == 0 && e.residual() < 0.0;
    }
    assert(threw);
  }

  // 4) Budget d’itérations insuffisant
  {
    lw::config::SolverConfig cfg(1);
    bool threw = false;
    try { (void)lw::solvers::size_debt(a, 81.39, cfg); }
    catch (const lw::NonConvergenceError& e) {
      threw = (e.solver() == "dscr") && e.iterations() == 1;
    }
    assert(threw);
  }

  // 5) Monotonie : tarif plus haut ⇒ plus de dette supportable
  {
    const auto lo = lw::solvers::size_debt(a, 70.0);
    const auto hi = lw::solvers::size_debt(a, 90.0);
    assert(lo.debt_fraction < hi.debt_fraction);
  }

  std::cout << "Debt sizing OK.\n";
  return 0;
}
