#pragma once
/**
 * @file assumptions.hpp
 * @brief Hypothèses techno-économiques d’un projet renouvelable (immuables, validées).
 *
 * # Contenu
 * - Technique : capacity_mw (>0), capacity_factor (]0,1]).
 * - Coûts : capital_expenditure_per_mw (>0, $/MW), o_m_cost_pct_of_capital_cost (>=0).
 * - Financement : structure dette/equity (optionnelle), cost_of_debt (>=0),
 *   cost_of_equity (>=0), tax_rate ([0,1[), dcsr (>0, DSCR minimal cible).
 * - Durées : project_lifetime_years ([1, 50]), debt_tenor_years (optionnel, <= durée de vie).
 * - Fiscalité : tax_loss_carryforward (report des pertes, désactivé par défaut).
 *
 * # Structure du capital
 * - Si une seule des deux parts est donnée, l’autre vaut 1 - part.
 * - Si aucune n’est donnée : Unspecified ⇒ le solveur DSCR dimensionne la dette.
 * - Si les deux sont données : debt + equity = 1 (tolérance 1e-6).
 *
 * # Conventions
 * - Taux et pourcentages en décimal (0.05 = 5 %).
 * - Dérivés (capital_cost, wacc, tax_adjusted_wacc) calculés, jamais saisis.
 * - Un objet Assumptions n’est jamais modifié : with_capital_structure() en
 *   produit une copie ajustée.
 */

#include <limits>
#include <optional>
#include <variant>

namespace lw {
namespace project {

/// @brief Structure du capital fixée (parts en décimal, somme = 1).
struct Specified {
  double debt_pct;
  double equity_pct;
};

/// @brief Structure du capital à dimensionner (cible DSCR).
struct Unspecified {};

using CapitalStructure = std::variant<Unspecified, Specified>;

/// Durée de vie maximale acceptée (années).
constexpr int kMaxProjectLifetimeYears = 50;

/// @brief Saisie brute (typiquement issue d’un JSON ou d’un CSV de config).
/// @details NaN = champ absent ; la validation a lieu dans Assumptions.
struct AssumptionInputs {
  double capacity_mw                  = std::numeric_limits<double>::quiet_NaN();
  double capacity_factor              = std::numeric_limits<double>::quiet_NaN();
  double capital_expenditure_per_mw   = std::numeric_limits<double>::quiet_NaN();
  double o_m_cost_pct_of_capital_cost = std::numeric_limits<double>::quiet_NaN();
  std::optional<double> debt_pct_of_capital_cost;
  std::optional<double> equity_pct_of_capital_cost;
  double cost_of_debt                 = std::numeric_limits<double>::quiet_NaN();
  double cost_of_equity               = std::numeric_limits<double>::quiet_NaN();
  double tax_rate                     = std::numeric_limits<double>::quiet_NaN();
  int    project_lifetime_years       = 0;
  double dcsr                         = std::numeric_limits<double>::quiet_NaN();
  std::optional<int> debt_tenor_years;
  bool   tax_loss_carryforward        = false;
};

/// @brief Valeurs par défaut du modèle solaire PV (30 MW, CF 10 %, 670 k$/MW…).
AssumptionInputs default_solar_pv_inputs();

/// @brief Hypothèses validées d’un projet (immuables).
struct Assumptions {
public:
  const double capacity_mw;
  const double capacity_factor;
  const double capital_expenditure_per_mw;
  const double o_m_cost_pct_of_capital_cost;
  const CapitalStructure capital_structure;
  const double cost_of_debt;
  const double cost_of_equity;
  const double tax_rate;
  const int    project_lifetime_years;
  const double dcsr;
  const int    debt_tenor_years;       ///< = project_lifetime_years si non fourni.
  const bool   tax_loss_carryforward;

  /// @brief Valide la saisie et résout la structure du capital.
  /// @throws lw::ValidationError (champ fautif nommé) si hors domaine.
  explicit Assumptions(const AssumptionInputs& in);

  /// @return capacity_mw * capital_expenditure_per_mw.
  double capital_cost() const noexcept { return capacity_mw * capital_expenditure_per_mw; }

  /// @return Production annuelle (MWh) : capacity_mw * capacity_factor * 8760.
  double annual_energy_mwh() const noexcept { return capacity_mw * capacity_factor * 8760.0; }

  bool has_capital_structure() const noexcept {
    return std::holds_alternative<Specified>(capital_structure);
  }

  /// @return Part de dette si la structure est fixée.
  std::optional<double> debt_pct() const noexcept;
  /// @return Part d’equity si la structure est fixée.
  std::optional<double> equity_pct() const noexcept;

  /// @return WACC (d*kd + e*ke) si la structure est fixée.
  std::optional<double> wacc() const noexcept;
  /// @return WACC après impôt (d*kd*(1-t) + e*ke) si la structure est fixée.
  std::optional<double> tax_adjusted_wacc() const noexcept;

  /// @brief Copie ajustée avec structure Specified{debt_pct, 1 - debt_pct}.
  /// @throws lw::ValidationError si debt_pct hors [0,1].
  Assumptions with_capital_structure(double debt_pct) const;

  /// @brief Repasse en saisie brute (utile pour sérialiser / modifier un champ).
  AssumptionInputs to_inputs() const;
};

/**
 * @brief Facteur de charge depuis un productible journalier moyen.
 * @param kwh_per_kwp_per_day Productible spécifique (kWh/kWp/jour, type atlas solaire).
 * @return kwh_per_kwp_per_day / 24.
 * @throws lw::ValidationError (champ daily_yield_kwh_per_kwp) si non fini, négatif ou > 24.
 * @note Utilisé par les lecteurs CSV/JSON quand capacity_factor est absent.
 */
double capacity_factor_from_daily_yield(double kwh_per_kwp_per_day);

} // namespace project
} // namespace lw
