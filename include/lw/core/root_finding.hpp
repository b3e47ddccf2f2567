#pragma once
/**
 * @file root_finding.hpp
 * @brief Recherche de racine 1D encadrée, sans dérivée (sécante + bisection).
 *
 * # Principe
 * - On part d’un encadrement [a, b] avec f(a) et f(b) de signes opposés.
 *   f(a) ou f(b) peuvent être ±inf (borne sentinelle jamais évaluée, ex :
 *   DSCR infini sans dette, IRR de -100 % au tarif de break-even).
 * - À chaque itération : évalue f(x), met à jour l’encadrement, tente un pas
 *   de sécante entre les deux derniers points. Si le pas sort de ]a, b[, ou
 *   si l’encadrement ne s’est pas réduit de moitié en deux pas ⇒ bisection.
 * - Convergence : |f(x)| <= tolerance. Sinon résultat non convergé (x = dernier
 *   point évalué) ; c’est à l’appelant de lever NonConvergenceError.
 *
 * # Journal
 * - Si cfg.record_log, chaque évaluation est enregistrée (iter, x, f(x)).
 */

#include <functional>
#include <vector>

#include <lw/config/solver_config.hpp>

namespace lw {
namespace core {

/// @brief Un point du journal d’itérations.
struct IterationPoint {
  int    iter;      ///< Numéro d’évaluation (1-based).
  double x;         ///< Point évalué.
  double residual;  ///< f(x).
};

/// @brief Résultat brut d’une recherche de racine.
struct RootResult {
  double x;          ///< Dernier point évalué (solution si convergé).
  double residual;   ///< f(x) au dernier point.
  int    iters;      ///< Évaluations consommées.
  bool   converged;  ///< true si |f(x)| <= tolerance.
  std::vector<IterationPoint> log; ///< Journal (vide si désactivé).
};

/**
 * @brief Racine de f dans ]a, b[ par sécante sauvegardée par bisection.
 * @param f   Fonction résidu (peut renvoyer ±inf, jamais NaN de préférence).
 * @param a   Borne basse.
 * @param fa  f(a) (peut être une sentinelle ±inf).
 * @param b   Borne haute (> a).
 * @param fb  f(b), de signe opposé à fa.
 * @param x0  Point de départ (ramené au milieu s’il sort de ]a, b[).
 * @param cfg Budget d’itérations et tolérance.
 */
RootResult find_root_bracketed(const std::function<double(double)>& f,
                               double a, double fa,
                               double b, double fb,
                               double x0,
                               const lw::config::SolverConfig& cfg);

} // namespace core
} // namespace lw
