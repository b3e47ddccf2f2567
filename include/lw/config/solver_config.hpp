#pragma once
/**
 * @file solver_config.hpp
 * @brief Paramètres explicites des solveurs (budget, tolérance, journal).
 *
 * # Contenu
 * - max_iterations         : budget d’évaluations du résidu (≥ 1).
 * - tolerance              : |résidu| <= tolerance ⇒ convergé (unités du résidu :
 *                            ratio DSCR pour la dette, taux d’IRR pour le tarif).
 * - max_bracket_expansions : nb max de doublements de la borne haute du tarif.
 * - record_log             : si true, le résultat porte le journal d’itérations.
 *
 * # Remarques
 * - Aucune constante cachée : les tests peuvent resserrer/relâcher ces valeurs.
 * - LcoeConfig regroupe les deux solveurs imbriqués (dette puis tarif).
 */

namespace lw {
namespace config {

/// @brief Configuration d’un solveur 1D.
struct SolverConfig {
  int    max_iterations;          ///< Budget d’itérations (évaluations du résidu).
  double tolerance;               ///< Tolérance absolue sur le résidu.
  int    max_bracket_expansions;  ///< Doublements max pour encadrer la racine.
  bool   record_log;              ///< Journal d’itérations (x, résidu).

  /// @brief Construit une configuration avec valeurs par défaut.
  SolverConfig(int max_iterations = 100,
               double tolerance = 1e-6,
               int max_bracket_expansions = 60,
               bool record_log = false) noexcept
      : max_iterations(max_iterations),
        tolerance(tolerance),
        max_bracket_expansions(max_bracket_expansions),
        record_log(record_log) {}
};

/// @brief Configuration du calcul de LCOE (dimensionnement dette + tarif).
struct LcoeConfig {
  SolverConfig debt;    ///< Solveur DSCR (fraction de dette).
  SolverConfig tariff;  ///< Solveur IRR equity (tarif).

  /// @brief Active/désactive le journal des deux solveurs.
  void enable_logs(bool on) noexcept {
    debt.record_log = on;
    tariff.record_log = on;
  }
};

} // namespace config
} // namespace lw
