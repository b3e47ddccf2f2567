#include <lw/cashflow/schedule.hpp>
#include <lw/core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace lw {
namespace cashflow {

std::vector<double> Schedule::equity_cashflows() const {
  std::vector<double> out;
  out.reserve(rows.size());
  for (const auto& r : rows) out.push_back(r.equity_cashflow);
  return out;
}

double annuity_payment(double principal, double rate, int years) noexcept {
  if (years <= 0 || principal <= 0.0) return 0.0;
  if (rate == 0.0) return principal / static_cast<double>(years);
  return principal * rate / (1.0 - std::pow(1.0 + rate, -static_cast<double>(years)));
}

double min_dscr(const Schedule& s) noexcept {
  double m = std::numeric_limits<double>::infinity();
  for (const auto& r : s.rows) {
    if (r.year > 0 && r.interest + r.principal > 0.0) m = std::min(m, r.dscr);
  }
  return m;
}

Schedule generate(const lw::project::Assumptions& a, double tariff, double debt_fraction) {
  if (!std::isfinite(tariff)) {
    throw lw::ValidationError("tariff", "generate: tariff must be finite");
  }
  if (!(debt_fraction >= 0.0 && debt_fraction <= 1.0)) {
    throw lw::ValidationError("debt_fraction", "generate: debt_fraction must be in [0, 1]");
  }

  const int    N       = a.project_lifetime_years;
  const int    tenor   = a.debt_tenor_years;
  const double capex   = a.capital_cost();
  const double energy  = a.annual_energy_mwh();
  const double opex    = a.o_m_cost_pct_of_capital_cost * capex;
  const double dep     = capex / static_cast<double>(N);
  const double kd      = a.cost_of_debt;
  const double inf     = std::numeric_limits<double>::infinity();

  Schedule s{};
  s.tariff = tariff;
  s.debt_fraction = debt_fraction;
  s.rows.reserve(static_cast<std::size_t>(N) + 1);

  // Année 0 : investissement, la dette tire sa part du capex
  double balance = debt_fraction * capex;
  {
    YearRow r0{};
    r0.year            = 0;
    r0.debt_eop        = balance;
    r0.equity_cashflow = -capex * (1.0 - debt_fraction);
    r0.dscr            = inf;
    s.rows.push_back(r0);
  }

  const double payment = annuity_payment(balance, kd, tenor);
  double loss_pool = 0.0; // pertes fiscales reportables

  for (int t = 1; t <= N; ++t) {
    YearRow r{};
    r.year         = t;
    r.energy_mwh   = energy;
    r.revenue      = energy * tariff;
    r.opex         = opex;
    r.ebitda       = r.revenue - r.opex;
    r.debt_bop     = balance;
    r.depreciation = dep;

    if (balance > 0.0 && t <= tenor) {
      r.interest  = balance * kd;
      r.principal = std::clamp(payment - r.interest, 0.0, balance);
      if (t == tenor) r.principal = balance; // solde (arrondis)
    }
    balance   -= r.principal;
    r.debt_eop = balance;

    r.taxable_income = r.ebitda - r.interest - r.depreciation;
    double base = r.taxable_income;
    if (a.tax_loss_carryforward) {
      if (base < 0.0) {
        loss_pool -= base;
        base = 0.0;
      } else {
        const double used = std::min(loss_pool, base);
        loss_pool -= used;
        base      -= used;
      }
    }
    r.tax = std::max(0.0, base) * a.tax_rate;

    r.equity_cashflow = r.ebitda - r.interest - r.principal - r.tax;

    const double service = r.interest + r.principal;
    r.dscr = (service > 0.0) ? r.ebitda / service : inf;

    s.rows.push_back(r);
  }

  return s;
}

} // namespace cashflow
} // namespace lw
