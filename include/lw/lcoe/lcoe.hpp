#pragma once
/**
 * @file lcoe.hpp
 * @brief Point d’entrée : LCOE, IRR equity, tableau de flux et hypothèses ajustées.
 *
 * # Séquence
 * 1) Hypothèses déjà validées (construction d’Assumptions).
 * 2) Structure du capital Unspecified : recherche de tarif provisoire avec
 *    dimensionnement DSCR imbriqué ⇒ Specified{d, 1 - d}.
 * 3) WACC / WACC après impôt sur la copie ajustée.
 * 4) Tarif d’équilibre à structure fixée ⇒ LCOE + tableau final.
 * 5) Résultat complet (tout ou rien : toute erreur de solveur remonte telle quelle).
 */

#include <vector>

#include <lw/cashflow/schedule.hpp>
#include <lw/config/solver_config.hpp>
#include <lw/core/root_finding.hpp>
#include <lw/project/assumptions.hpp>

namespace lw {
namespace lcoe {

struct LcoeResult {
  lw::cashflow::Schedule schedule;               ///< Tableau au LCOE (N + 1 lignes).
  double lcoe;                                   ///< Tarif d’équilibre ($/MWh).
  double equity_irr;                             ///< ≈ cost_of_equity par construction.
  lw::project::Assumptions adjusted_assumptions; ///< Structure du capital résolue.
  bool debt_capped;                              ///< Dette dimensionnée bornée à 1.
  int  sizing_iters;                             ///< 0 si la structure était fournie.
  int  tariff_iters;
  std::vector<lw::core::IterationPoint> sizing_log; ///< Solveur DSCR au tarif provisoire.
  std::vector<lw::core::IterationPoint> tariff_log; ///< Solveur de tarif final.
};

/**
 * @brief Calcule le LCOE d’un projet.
 * @throws lw::NonConvergenceError si un solveur échoue (pas de reprise locale).
 */
LcoeResult compute_lcoe(const lw::project::Assumptions& assumptions,
                        const lw::config::LcoeConfig& cfg = {});

} // namespace lcoe
} // namespace lw
