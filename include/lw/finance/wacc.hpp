#pragma once
/**
 * @file wacc.hpp
 * @brief Coût moyen pondéré du capital (informatif, n’alimente pas les solveurs).
 *
 *   wacc              = d * kd + e * ke
 *   tax_adjusted_wacc = d * kd * (1 - t) + e * ke
 */

namespace lw {
namespace finance {

/// @brief WACC avant impôt.
double wacc(double debt_pct, double equity_pct,
            double cost_of_debt, double cost_of_equity) noexcept;

/// @brief WACC après impôt (bouclier fiscal sur les intérêts).
double tax_adjusted_wacc(double debt_pct, double equity_pct,
                         double cost_of_debt, double cost_of_equity,
                         double tax_rate) noexcept;

} // namespace finance
} // namespace lw
