#pragma once
/**
 * @file debt_sizing.hpp
 * @brief Dimensionnement de la dette sur une cible de DSCR minimal.
 *
 * # Résidu
 *   f(d) = min_t DSCR_t(generate(a, tarif, d)) - a.dcsr
 * décroissant en d, f(0) = +inf (pas de dette ⇒ DSCR infini).
 *
 * # Politique
 * - f(1) >= 0 : la cible est tenue même 100 % dette ⇒ d = 1, capped = true.
 * - EBITDA <= 0 au tarif donné : aucune dette ne tient la cible ⇒ NonConvergenceError.
 * - Budget épuisé sans |f| <= tolerance ⇒ NonConvergenceError (dernier résidu, itérations).
 * - Départ au milieu de [0,1], sécante sauvegardée par bisection (core::find_root_bracketed).
 */

#include <vector>

#include <lw/cashflow/schedule.hpp>
#include <lw/config/solver_config.hpp>
#include <lw/core/root_finding.hpp>
#include <lw/project/assumptions.hpp>

namespace lw {
namespace solvers {

/// @brief Résultat du dimensionnement (toujours convergé si renvoyé).
struct DebtSizingResult {
  double debt_fraction;  ///< Part de dette dans [0,1].
  double min_dscr;       ///< DSCR minimal atteint.
  double residual;       ///< min_dscr - cible.
  int    iters;          ///< Évaluations du résidu.
  bool   converged;
  bool   capped;         ///< true si borné à 1 (cible tenue avec marge).
  lw::cashflow::Schedule schedule;          ///< Tableau à la fraction retenue.
  std::vector<lw::core::IterationPoint> log; ///< Journal (vide si désactivé).
};

/**
 * @brief Fraction de dette telle que le DSCR minimal égale a.dcsr.
 * @param a      Hypothèses (la structure du capital éventuelle est ignorée).
 * @param tariff Tarif fixé ($/MWh).
 * @param cfg    Budget et tolérance (unités de DSCR).
 * @throws lw::NonConvergenceError si la cible est inatteignable ou le budget épuisé.
 */
DebtSizingResult size_debt(const lw::project::Assumptions& a,
                           double tariff,
                           const lw::config::SolverConfig& cfg = {});

} // namespace solvers
} // namespace lw
