#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>

#include <lw/project/assumptions.hpp>
#include <lw/cashflow/schedule.hpp>
#include <lw/lcoe/lcoe.hpp>

namespace service {

// Statuts "HTTP" renvoyés dans la réponse (champ "status")
enum Status : int {
  StatusOk             = 200,
  StatusInvalidRequest = 422,
  StatusSolverFailure  = 500
};

// Requête JSON → saisie brute. Champs absents = valeurs par défaut du modèle PV,
// debt/equity absents ou null = structure à dimensionner ; capacity_factor absent
// et daily_yield_kwh_per_kwp donné = facteur de charge dérivé du productible.
// Lève lw::ValidationError (champ nommé) si un champ a le mauvais type.
lw::project::AssumptionInputs inputsFromJson(const QJsonObject& o);

QJsonObject assumptionsToJson(const lw::project::Assumptions& a);
QJsonObject rowToJson(const lw::cashflow::YearRow& r);
QJsonObject resultToJson(const lw::lcoe::LcoeResult& r);

// Corps de requête → réponse complète (200 / 422 / 500). Ne lève pas pour les
// erreurs métier : ValidationError → 422, NonConvergenceError → 500,
// autre std::exception → 500 ("internal").
QJsonObject handleRequest(const QByteArray& body);

} // namespace service
