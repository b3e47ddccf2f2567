#include "lw/project/assumptions.hpp"
#include "lw/core/errors.hpp"
#include "lw/finance/wacc.hpp"
#include <cmath>
#include <string>

namespace {

constexpr double SPLIT_TOL = 1e-6; // tolérance sur debt + equity = 1

inline void require(bool ok, const char* field, const char* constraint) {
  if (!ok) {
    throw lw::ValidationError(field, std::string("Assumptions: ") + field + " must be " + constraint);
  }
}

inline bool in_unit_interval(double x) { return std::isfinite(x) && x >= 0.0 && x <= 1.0; }

// Résout la structure du capital (une part donnée ⇒ l’autre = 1 - part)
lw::project::CapitalStructure resolve_structure(const lw::project::AssumptionInputs& in) {
  const auto& d = in.debt_pct_of_capital_cost;
  const auto& e = in.equity_pct_of_capital_cost;
  if (d) require(in_unit_interval(*d), "debt_pct_of_capital_cost", "in [0, 1]");
  if (e) require(in_unit_interval(*e), "equity_pct_of_capital_cost", "in [0, 1]");

  if (d && e) {
    if (std::fabs(*d + *e - 1.0) > SPLIT_TOL) {
      throw lw::ValidationError("equity_pct_of_capital_cost",
          "Assumptions: debt_pct_of_capital_cost + equity_pct_of_capital_cost must equal 1");
    }
    return lw::project::Specified{*d, *e};
  }
  if (d) return lw::project::Specified{*d, 1.0 - *d};
  if (e) return lw::project::Specified{1.0 - *e, *e};
  return lw::project::Unspecified{};
}

// Valide tout sauf la structure du capital ; renvoie la saisie telle quelle
const lw::project::AssumptionInputs& validated(const lw::project::AssumptionInputs& in) {
  require(std::isfinite(in.capacity_mw) && in.capacity_mw > 0.0, "capacity_mw", "> 0");
  require(std::isfinite(in.capacity_factor) && in.capacity_factor > 0.0 && in.capacity_factor <= 1.0,
          "capacity_factor", "in (0, 1]");
  require(std::isfinite(in.capital_expenditure_per_mw) && in.capital_expenditure_per_mw > 0.0,
          "capital_expenditure_per_mw", "> 0");
  require(std::isfinite(in.o_m_cost_pct_of_capital_cost) && in.o_m_cost_pct_of_capital_cost >= 0.0,
          "o_m_cost_pct_of_capital_cost", ">= 0");
  require(std::isfinite(in.cost_of_debt) && in.cost_of_debt >= 0.0, "cost_of_debt", ">= 0");
  require(std::isfinite(in.cost_of_equity) && in.cost_of_equity >= 0.0, "cost_of_equity", ">= 0");
  require(std::isfinite(in.tax_rate) && in.tax_rate >= 0.0 && in.tax_rate < 1.0, "tax_rate", "in [0, 1)");
  require(in.project_lifetime_years > 0 && in.project_lifetime_years <= lw::project::kMaxProjectLifetimeYears,
          "project_lifetime_years", "in [1, 50]");
  require(std::isfinite(in.dcsr) && in.dcsr > 0.0, "dcsr", "> 0");
  if (in.debt_tenor_years) {
    require(*in.debt_tenor_years >= 1 && *in.debt_tenor_years <= in.project_lifetime_years,
            "debt_tenor_years", "in [1, project_lifetime_years]");
  }
  // Production nulle ⇒ division par zéro dans le solveur de tarif : on coupe court
  const double energy = in.capacity_mw * in.capacity_factor * 8760.0;
  require(std::isfinite(energy) && energy > 0.0, "capacity_factor", "such that annual energy output > 0");
  return in;
}

} // namespace

namespace lw::project {

AssumptionInputs default_solar_pv_inputs() {
  AssumptionInputs in;
  in.capacity_mw                  = 30.0;
  in.capacity_factor              = 0.10;
  in.capital_expenditure_per_mw   = 670'000.0;
  in.o_m_cost_pct_of_capital_cost = 0.02;
  in.cost_of_debt                 = 0.05;
  in.cost_of_equity               = 0.10;
  in.tax_rate                     = 0.30;
  in.project_lifetime_years       = 25;
  in.dcsr                         = 1.3;
  return in;
}

Assumptions::Assumptions(const AssumptionInputs& in)
    : capacity_mw(validated(in).capacity_mw),
      capacity_factor(in.capacity_factor),
      capital_expenditure_per_mw(in.capital_expenditure_per_mw),
      o_m_cost_pct_of_capital_cost(in.o_m_cost_pct_of_capital_cost),
      capital_structure(resolve_structure(in)),
      cost_of_debt(in.cost_of_debt),
      cost_of_equity(in.cost_of_equity),
      tax_rate(in.tax_rate),
      project_lifetime_years(in.project_lifetime_years),
      dcsr(in.dcsr),
      debt_tenor_years(in.debt_tenor_years.value_or(in.project_lifetime_years)),
      tax_loss_carryforward(in.tax_loss_carryforward) {}

std::optional<double> Assumptions::debt_pct() const noexcept {
  if (const auto* s = std::get_if<Specified>(&capital_structure)) return s->debt_pct;
  return std::nullopt;
}

std::optional<double> Assumptions::equity_pct() const noexcept {
  if (const auto* s = std::get_if<Specified>(&capital_structure)) return s->equity_pct;
  return std::nullopt;
}

std::optional<double> Assumptions::wacc() const noexcept {
  const auto* s = std::get_if<Specified>(&capital_structure);
  if (!s) return std::nullopt;
  return lw::finance::wacc(s->debt_pct, s->equity_pct, cost_of_debt, cost_of_equity);
}

std::optional<double> Assumptions::tax_adjusted_wacc() const noexcept {
  const auto* s = std::get_if<Specified>(&capital_structure);
  if (!s) return std::nullopt;
  return lw::finance::tax_adjusted_wacc(s->debt_pct, s->equity_pct, cost_of_debt, cost_of_equity, tax_rate);
}

AssumptionInputs Assumptions::to_inputs() const {
  AssumptionInputs in;
  in.capacity_mw                  = capacity_mw;
  in.capacity_factor              = capacity_factor;
  in.capital_expenditure_per_mw   = capital_expenditure_per_mw;
  in.o_m_cost_pct_of_capital_cost = o_m_cost_pct_of_capital_cost;
  in.debt_pct_of_capital_cost     = debt_pct();
  in.equity_pct_of_capital_cost   = equity_pct();
  in.cost_of_debt                 = cost_of_debt;
  in.cost_of_equity               = cost_of_equity;
  in.tax_rate                     = tax_rate;
  in.project_lifetime_years       = project_lifetime_years;
  in.dcsr                         = dcsr;
  in.debt_tenor_years             = debt_tenor_years;
  in.tax_loss_carryforward        = tax_loss_carryforward;
  return in;
}

Assumptions Assumptions::with_capital_structure(double debt_pct) const {
  AssumptionInputs in = to_inputs();
  in.debt_pct_of_capital_cost   = debt_pct;
  in.equity_pct_of_capital_cost.reset(); // dérivée : 1 - debt_pct
  return Assumptions(in);
}

double capacity_factor_from_daily_yield(double kwh_per_kwp_per_day) {
  if (!std::isfinite(kwh_per_kwp_per_day) || kwh_per_kwp_per_day < 0.0 || kwh_per_kwp_per_day > 24.0) {
    throw lw::ValidationError("daily_yield_kwh_per_kwp",
        "capacity_factor_from_daily_yield: daily yield must be in [0, 24] kWh/kWp");
  }
  return kwh_per_kwp_per_day / 24.0;
}

} // namespace lw::project
