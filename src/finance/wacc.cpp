#include "lw/finance/wacc.hpp"

namespace lw::finance {

double wacc(double debt_pct, double equity_pct,
            double cost_of_debt, double cost_of_equity) noexcept {
  return debt_pct * cost_of_debt + equity_pct * cost_of_equity;
}

double tax_adjusted_wacc(double debt_pct, double equity_pct,
                         double cost_of_debt, double cost_of_equity,
                         double tax_rate) noexcept {
  return debt_pct * cost_of_debt * (1.0 - tax_rate) + equity_pct * cost_of_equity;
}

} // namespace lw::finance
