#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include <cassert>
#include <cmath>
#include <iostream>

#include "JsonCodec.hpp"

static const QByteArray kExample = R"({
  "capacity_mw": 30,
  "capacity_factor": 0.097,
  "capital_expenditure_per_mw": 670000,
  "o_m_cost_pct_of_capital_cost": 0.02,
  "debt_pct_of_capital_cost": null,
  "cost_of_debt": 0.04,
  "cost_of_equity": 0.12,
  "tax_rate": 0.25,
  "project_lifetime_years": 20,
  "dcsr": 1.3
})";

int main() {
  // 1) Requête valide
  {
    const QJsonObject r = service::handleRequest(kExample);
    assert(r.value("status").toInt() == 200);
    assert(std::abs(r.value("lcoe").toDouble() - 81.392) < 0.05);
    assert(std::abs(r.value("equity_irr").toDouble() - 0.12) < 1e-4);
    assert(r.value("debt_capped").toBool() == false);

    const QJsonArray rows = r.value("schedule").toArray();
    assert(rows.size() == 21);
    assert(rows.at(0).toObject().value("dscr").isNull());        // pas de service en année 0
    assert(rows.at(1).toObject().value("dscr").isDouble());
    assert(rows.at(20).toObject().value("year").toInt() == 20);

    const QJsonObject a = r.value("assumptions").toObject();
    assert(a.value("capital_cost").toDouble() == 20100000.0);
    const double d = a.value("debt_pct_of_capital_cost").toDouble();
    assert(d > 0.0 && d < 1.0);
    assert(a.value("wacc").isDouble());
    assert(a.value("tax_adjusted_wacc").isDouble());
  }

  // 2) Champs absents : hypothèses PV par défaut
  {
    const QJsonObject r = service::handleRequest("{}");
    assert(r.value("status").toInt() == 200);
    assert(std::abs(r.value("lcoe").toDouble() - 75.41) < 0.05);
    assert(r.value("schedule").toArray().size() == 26);
  }

  // 2b) Productible journalier à la place du facteur de charge
  {
    const QJsonObject r = service::handleRequest(R"({"daily_yield_kwh_per_kwp": 2.4})");
    assert(r.value("status").toInt() == 200);
    assert(std::abs(r.value("assumptions").toObject().value("capacity_factor").toDouble() - 0.10) < 1e-12);
    assert(std::abs(r.value("lcoe").toDouble() - 75.41) < 0.05);

    const QJsonObject bad = service::handleRequest(R"({"daily_yield_kwh_per_kwp": 30})");
    assert(bad.value("status").toInt() == 422);
    assert(bad.value("field").toString() == "daily_yield_kwh_per_kwp");
  }

  // 3) Validation : champ nommé
  {
    const QJsonObject r = service::handleRequest(R"({"capacity_factor": 0})");
    assert(r.value("status").toInt() == 422);
    assert(r.value("error").toString() == "validation");
    assert(r.value("field").toString() == "capacity_factor");
  }
  {
    const QJsonObject r = service::handleRequest(
        R"({"debt_pct_of_capital_cost": 0.6, "equity_pct_of_capital_cost": 0.6})");
    assert(r.value("status").toInt() == 422);
    assert(r.value("field").toString() == "equity_pct_of_capital_cost");
  }
  {
    const QJsonObject r = service::handleRequest(R"({"capacity_mw": "thirty"})");
    assert(r.value("status").toInt() == 422);
    assert(r.value("field").toString() == "capacity_mw");
  }
  {
    const QJsonObject r = service::handleRequest(R"({"project_lifetime_years": 1000000000})");
    assert(r.value("status").toInt() == 422);
    assert(r.value("field").toString() == "project_lifetime_years");
  }
  {
    const QJsonObject r = service::handleRequest(R"({"project_lifetime_years": 20.5})");
    assert(r.value("status").toInt() == 422);
    assert(r.value("field").toString() == "project_lifetime_years");
  }

  // 4) Corps illisible : pas de champ identifiable
  {
    const QJsonObject r = service::handleRequest("{ not json");
    assert(r.value("status").toInt() == 422);
    assert(r.contains("field") && r.value("field").isNull());

    const QJsonObject r2 = service::handleRequest("[1, 2, 3]");
    assert(r2.value("status").toInt() == 422);
  }

  // 5) Échec de solveur : 100 % dette, IRR equity indéfini
  {
    const QJsonObject r = service::handleRequest(
        R"({"debt_pct_of_capital_cost": 1.0, "equity_pct_of_capital_cost": 0.0})");
    assert(r.value("status").toInt() == 500);
    assert(r.value("error").toString() == "non_convergence");
    assert(r.value("solver").toString() == "tariff");
    assert(r.contains("iterations"));
  }

  std::cout << "JSON codec OK.\n";
  return 0;
}
