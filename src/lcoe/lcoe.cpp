#include <lw/lcoe/lcoe.hpp>
#include <lw/solvers/debt_sizing.hpp>
#include <lw/solvers/tariff_solver.hpp>

#include <utility>

namespace lw {
namespace lcoe {

LcoeResult compute_lcoe(const lw::project::Assumptions& assumptions,
                        const lw::config::LcoeConfig& cfg) {
  bool capped = false;
  int sizing_iters = 0;
  std::vector<lw::core::IterationPoint> sizing_log;

  // Structure du capital : fournie, ou dimensionnée au tarif provisoire
  double debt_fraction = 0.0;
  if (const auto d = assumptions.debt_pct()) {
    debt_fraction = *d;
  } else {
    const auto provisional = lw::solvers::solve_tariff_sizing_debt(assumptions, cfg.debt, cfg.tariff);
    auto sized = lw::solvers::size_debt(assumptions, provisional.tariff, cfg.debt);
    debt_fraction = sized.debt_fraction;
    capped        = sized.capped;
    sizing_iters  = sized.iters;
    sizing_log    = std::move(sized.log);
  }

  // Copie ajustée (wacc et tax_adjusted_wacc deviennent disponibles)
  lw::project::Assumptions adjusted = assumptions.with_capital_structure(debt_fraction);

  auto tariff = lw::solvers::solve_tariff(adjusted, debt_fraction, cfg.tariff);

  return LcoeResult{
    std::move(tariff.schedule),
    tariff.tariff,
    tariff.equity_irr,
    adjusted,
    capped,
    sizing_iters,
    tariff.iters,
    std::move(sizing_log),
    std::move(tariff.log)
  };
}

} // namespace lcoe
} // namespace lw
