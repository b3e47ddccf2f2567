#pragma once
#include <string>
#include <vector>
#include <lw/project/assumptions.hpp>

namespace lw::io {

// Lit un CSV de configuration à deux colonnes "clé,valeur" :
//   capacity_mw,30
//   capacity_factor,0.097
//   ...
// - en-tête optionnel (key,value), lignes vides et commentaires "#" ignorés ;
// - clés insensibles à la casse, synonymes acceptés (capex_per_mw, dscr, lifetime...) ;
// - valeur vide pour debt/equity/tenor = champ absent ;
// - capacity_factor absent : dérivé de daily_yield_kwh_per_kwp (kWh/kWp/jour) ;
// - clé inconnue : avertissement (warnings), pas d'erreur.
// Lève std::runtime_error si le fichier est illisible,
// lw::ValidationError (clé nommée) si une clé obligatoire manque ou une valeur est illisible.
lw::project::AssumptionInputs
read_assumptions_csv(const std::string& path,
                     std::vector<std::string>* warnings = nullptr);

} // namespace lw::io
