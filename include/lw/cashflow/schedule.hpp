#pragma once
/**
 * @file schedule.hpp
 * @brief Générateur de cashflows annuels d’un projet (année 0 = investissement).
 *
 * # Modèle (année t = 1..N, N = project_lifetime_years)
 * - Production   : E = capacity_mw * capacity_factor * 8760 (constante, sans dégradation).
 * - Revenus      : E * tarif ; Opex = o_m_pct * capital_cost (sans indexation).
 * - EBITDA       : revenus - opex.
 * - Dette        : D0 = debt_fraction * capital_cost, annuité constante au taux
 *                  cost_of_debt sur debt_tenor_years (remboursement linéaire si taux nul).
 *                  La dernière année de maturité solde le capital restant.
 * - Amortissement: linéaire, capital_cost / N.
 * - Impôt        : max(0, EBITDA - intérêts - amortissement) * tax_rate,
 *                  après imputation du stock de pertes si tax_loss_carryforward.
 * - Equity       : année 0 = -capital_cost * (1 - debt_fraction) ;
 *                  ensuite EBITDA - intérêts - principal - impôt.
 * - DSCR         : EBITDA / (intérêts + principal) si service de la dette > 0, sinon +inf.
 *
 * # Garanties
 * - N + 1 lignes ; solde de dette >= 0 et nul au plus tard en fin de maturité.
 * - Fonction pure : mêmes entrées ⇒ mêmes sorties, aucun état partagé.
 */

#include <vector>
#include <lw/project/assumptions.hpp>

namespace lw {
namespace cashflow {

/// @brief Une ligne (année) du tableau de flux.
struct YearRow {
  int    year;              ///< 0 = investissement.
  double energy_mwh;        ///< Production annuelle (MWh).
  double revenue;
  double opex;
  double ebitda;
  double interest;
  double principal;
  double debt_bop;          ///< Encours début de période.
  double debt_eop;          ///< Encours fin de période.
  double depreciation;
  double taxable_income;    ///< Avant imputation des pertes reportées.
  double tax;
  double equity_cashflow;   ///< Flux equity après impôt.
  double dscr;              ///< +inf sans service de la dette.
};

/// @brief Tableau de flux complet pour un tarif et une fraction de dette.
struct Schedule {
  double tariff;            ///< Tarif ($/MWh) utilisé.
  double debt_fraction;     ///< Part de dette dans capital_cost.
  std::vector<YearRow> rows;

  /// @return Flux equity (année 0 incluse), dans l’ordre.
  std::vector<double> equity_cashflows() const;
};

/**
 * @brief Construit le tableau de flux.
 * @param a             Hypothèses validées.
 * @param tariff        Tarif en $/MWh (fini).
 * @param debt_fraction Part de dette dans [0,1].
 * @throws lw::ValidationError si tariff non fini ou debt_fraction hors [0,1].
 */
Schedule generate(const lw::project::Assumptions& a, double tariff, double debt_fraction);

/// @brief Annuité constante d’un prêt (principal, taux, n années). Linéaire si taux nul.
double annuity_payment(double principal, double rate, int years) noexcept;

/// @return DSCR minimal sur les années avec service de la dette (+inf si aucune).
double min_dscr(const Schedule& s) noexcept;

} // namespace cashflow
} // namespace lw
