#pragma once
/**
 * @file errors.hpp
 * @brief Exceptions de la lib : hypothèses invalides et solveurs non convergés.
 *
 * # Politique
 * - ValidationError : hypothèse hors domaine ou incohérente (jamais retentée).
 * - NonConvergenceError : un solveur a épuisé son budget d’itérations ou n’a
 *   pas pu encadrer de racine. Porte le dernier résidu et le nombre d’itérations.
 * - Aucun résultat partiel n’est renvoyé : on lève et on laisse remonter.
 */

#include <stdexcept> // std::invalid_argument, std::runtime_error
#include <string>
#include <utility>   // std::move

namespace lw {

/// @brief Hypothèse hors domaine (nomme le champ fautif).
class ValidationError : public std::invalid_argument {
public:
  ValidationError(std::string field, const std::string& what)
      : std::invalid_argument(what), field_(std::move(field)) {}

  /// @return Nom du champ fautif (ex : "capacity_factor").
  const std::string& field() const noexcept { return field_; }

private:
  std::string field_;
};

/// @brief Échec d’un solveur itératif (budget épuisé ou racine non encadrée).
class NonConvergenceError : public std::runtime_error {
public:
  NonConvergenceError(std::string solver, const std::string& what,
                      double residual, int iterations)
      : std::runtime_error(what),
        solver_(std::move(solver)),
        residual_(residual),
        iterations_(iterations) {}

  const std::string& solver() const noexcept { return solver_; }
  double residual() const noexcept { return residual_; }   ///< Dernier résidu évalué.
  int iterations() const noexcept { return iterations_; }  ///< Itérations consommées.

private:
  std::string solver_;
  double residual_;
  int iterations_;
};

} // namespace lw
