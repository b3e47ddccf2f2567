#include "lw/project/assumptions.hpp"
#include "lw/core/errors.hpp"
#include <cmath>
#include <cassert>
#include <functional>
#include <iostream>
#include <string>
#include <variant>

// Cas de référence (ferme solaire 30 MW)
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

// Vérifie qu’une saisie est rejetée en nommant le bon champ
static void expect_invalid(const std::function<void(lw::project::AssumptionInputs&)>& edit,
                           const std::string& field) {
  auto in = example_inputs();
  edit(in);
  bool threw = false;
  try {
    lw::project::Assumptions a(in);
    (void)a;
  } catch (const lw::ValidationError& e) {
    threw = true;
    if (e.field() != field) std::cerr << "expected field " << field << ", got " << e.field() << "\n";
    assert(e.field() == field);
    assert(std::string(e.what()).find(field) != std::string::npos);
  }
  assert(threw);
}

int main() {
  // 1) Cas nominal : dérivés et structure non spécifiée
  {
    const lw::project::Assumptions a(example_inputs());
    assert(a.capital_cost() == 20'100'000.0);
    assert(std::abs(a.annual_energy_mwh() - 25491.6) < 1e-9);
    assert(!a.has_capital_structure());
    assert(std::holds_alternative<lw::project::Unspecified>(a.capital_structure));
    assert(!a.debt_pct() && !a.equity_pct());
    assert(!a.wacc() && !a.tax_adjusted_wacc());
    assert(a.debt_tenor_years == 20);          // défaut = durée de vie
    assert(!a.tax_loss_carryforward);
  }

  // 2) Une seule part fournie → l’autre est dérivée
  {
    auto in = example_inputs();
    in.debt_pct_of_capital_cost = 0.7;
    const lw::project::Assumptions a(in);
    assert(a.has_capital_structure());
    assert(std::abs(*a.equity_pct() - 0.3) < 1e-15);

    auto in2 = example_inputs();
    in2.equity_pct_of_capital_cost = 0.25;
    const lw::project::Assumptions b(in2);
    assert(std::abs(*b.debt_pct() - 0.75) < 1e-15);

    // WACC disponibles dès que la structure est fixée
    assert(std::abs(*b.wacc() - (0.75 * 0.04 + 0.25 * 0.12)) < 1e-15);
    assert(std::abs(*b.tax_adjusted_wacc() - (0.75 * 0.04 * 0.75 + 0.25 * 0.12)) < 1e-15);
  }

  // 3) Deux parts cohérentes (tolérance 1e-6) acceptées
  {
    auto in = example_inputs();
    in.debt_pct_of_capital_cost   = 0.6;
    in.equity_pct_of_capital_cost = 0.4 + 5e-7;
    const lw::project::Assumptions a(in);
    assert(a.has_capital_structure());
  }

  // 4) Copie ajustée : l’original reste inchangé
  {
    const lw::project::Assumptions a(example_inputs());
    const auto b = a.with_capital_structure(0.8);
    assert(!a.has_capital_structure());
    assert(*b.debt_pct() == 0.8);
    assert(std::abs(*b.equity_pct() - 0.2) < 1e-15);
    assert(b.capital_cost() == a.capital_cost());
    assert(b.dcsr == a.dcsr);
  }

  // 5) Rejets (champ nommé)
  expect_invalid([](auto& in){ in.capacity_factor = 0.0; }, "capacity_factor");
  expect_invalid([](auto& in){ in.capacity_factor = 1.2; }, "capacity_factor");
  expect_invalid([](auto& in){ in.capacity_mw = 0.0; }, "capacity_mw");
  expect_invalid([](auto& in){ in.capacity_mw = std::nan(""); }, "capacity_mw");
  expect_invalid([](auto& in){ in.capital_expenditure_per_mw = -1.0; }, "capital_expenditure_per_mw");
  expect_invalid([](auto& in){ in.o_m_cost_pct_of_capital_cost = -0.01; }, "o_m_cost_pct_of_capital_cost");
  expect_invalid([](auto& in){ in.cost_of_debt = -0.01; }, "cost_of_debt");
  expect_invalid([](auto& in){ in.cost_of_equity = -0.01; }, "cost_of_equity");
  expect_invalid([](auto& in){ in.tax_rate = 1.0; }, "tax_rate");
  expect_invalid([](auto& in){ in.project_lifetime_years = 0; }, "project_lifetime_years");
  expect_invalid([](auto& in){ in.project_lifetime_years = 51; }, "project_lifetime_years");
  expect_invalid([](auto& in){ in.project_lifetime_years = 2'000'000'000; }, "project_lifetime_years");
  expect_invalid([](auto& in){ in.dcsr = 0.0; }, "dcsr");
  expect_invalid([](auto& in){ in.debt_tenor_years = 25; }, "debt_tenor_years");
  expect_invalid([](auto& in){ in.debt_pct_of_capital_cost = 1.5; }, "debt_pct_of_capital_cost");
  expect_invalid([](auto& in){ in.equity_pct_of_capital_cost = -0.1; }, "equity_pct_of_capital_cost");
  expect_invalid([](auto& in){
    in.debt_pct_of_capital_cost = 0.6;
    in.equity_pct_of_capital_cost = 0.6;
  }, "equity_pct_of_capital_cost");

  // with_capital_structure revalide
  {
    const lw::project::Assumptions a(example_inputs());
    bool threw = false;
    try { (void)a.with_capital_structure(1.01); }
    catch (const lw::ValidationError& e) { threw = (e.field() == "debt_pct_of_capital_cost"); }
    assert(threw);
  }

  // 6) Défauts du modèle PV et conversion du productible journalier
  {
    const lw::project::Assumptions d(lw::project::default_solar_pv_inputs());
    assert(d.capacity_mw == 30.0 && d.project_lifetime_years == 25);
    assert(!d.has_capital_structure());

    assert(std::abs(lw::project::capacity_factor_from_daily_yield(4.8) - 0.2) < 1e-15);
    bool threw = false;
    try { (void)lw::project::capacity_factor_from_daily_yield(25.0); }
    catch (const lw::ValidationError& e) { threw = (e.field() == "daily_yield_kwh_per_kwp"); }
    assert(threw);
  }

  std::cout << "Assumptions OK.\n";
  return 0;
}
