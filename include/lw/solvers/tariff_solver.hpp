#pragma once
/**
 * @file tariff_solver.hpp
 * @brief Tarif d’équilibre (LCOE) : IRR equity après impôt = cost_of_equity.
 *
 * # Résidu
 *   g(t) = IRR(flux equity de generate(a, t, d)) - a.cost_of_equity
 * Flux sans IRR : -1 (perte totale) si la NPV reste <= 0.
 *
 * # Encadrement
 * - Borne basse : tarif de break-even EBITDA, t_be = opex / production
 *   (g traité comme -inf, jamais évalué).
 * - Borne haute : t_be + k * pas, pas = capital_cost / (production * durée de vie),
 *   k = 1, 2, 4, ... jusqu’à un IRR convergé > cost_of_equity
 *   (au plus cfg.max_bracket_expansions doublements).
 * - Tarif sans apport equity (dette à 100 %) : IRR indéfini, l’encadrement est
 *   resserré par bisection sous ce tarif (au plus cfg.max_iterations pas).
 * - Départ au milieu de l’encadrement ; convergence |g| <= cfg.tolerance.
 *
 * # Variantes
 * - solve_tariff : structure du capital fixée (fraction de dette d).
 * - solve_tariff_sizing_debt : à chaque tarif candidat, la dette est d’abord
 *   dimensionnée sur la cible DSCR (solveur imbriqué, aucun état partagé).
 */

#include <vector>

#include <lw/cashflow/schedule.hpp>
#include <lw/config/solver_config.hpp>
#include <lw/core/root_finding.hpp>
#include <lw/project/assumptions.hpp>

namespace lw {
namespace solvers {

/// @brief Résultat de la recherche de tarif (toujours convergé si renvoyé).
struct TariffResult {
  double tariff;         ///< Tarif d’équilibre ($/MWh) = LCOE.
  double equity_irr;     ///< IRR equity du tableau final.
  double debt_fraction;  ///< Fraction de dette utilisée au tarif final.
  bool   debt_capped;    ///< Dette bornée à 1 (variante imbriquée uniquement).
  double residual;       ///< g(tarif).
  int    iters;          ///< Évaluations du résidu (hors encadrement).
  bool   converged;
  lw::cashflow::Schedule schedule;           ///< Tableau au tarif final.
  std::vector<lw::core::IterationPoint> log; ///< Journal (vide si désactivé).
};

/// @return Tarif annulant l’EBITDA : opex / production annuelle.
double breakeven_ebitda_tariff(const lw::project::Assumptions& a) noexcept;

/// @return IRR equity d’un tableau ; -1 / +inf si pas de racine.
double equity_irr(const lw::cashflow::Schedule& s);

/**
 * @brief Tarif d’équilibre à structure du capital fixée.
 * @param debt_fraction Part de dette dans [0,1].
 * @throws lw::NonConvergenceError si non encadré ou budget épuisé.
 */
TariffResult solve_tariff(const lw::project::Assumptions& a,
                          double debt_fraction,
                          const lw::config::SolverConfig& cfg = {});

/**
 * @brief Tarif d’équilibre avec dimensionnement DSCR de la dette à chaque tarif candidat.
 * @throws lw::NonConvergenceError si l’un des deux solveurs échoue.
 */
TariffResult solve_tariff_sizing_debt(const lw::project::Assumptions& a,
                                      const lw::config::SolverConfig& debt_cfg = {},
                                      const lw::config::SolverConfig& tariff_cfg = {});

} // namespace solvers
} // namespace lw
