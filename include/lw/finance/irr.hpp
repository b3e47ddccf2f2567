#pragma once
#include <vector>

namespace lw::finance {

struct IrrResult {
  double rate;      // solution (ou -1 / +inf / NaN si pas de racine)
  int    iters;     // itérations effectuées (Newton + éventuelle bisection)
  bool   converged; // true si tolérance atteinte
};

// NPV(rate) = sum_t cf[t] / (1+rate)^t, t = 0..n-1 (cf[0] non actualisé).
double npv(double rate, const std::vector<double>& cashflows) noexcept;

// Racine de NPV sur ]-0.99, +inf[. Newton sauvegardé + bisection.
// Si NPV change de signe plusieurs fois, retient le dernier passage de > 0 à < 0.
// Pas de racine : rate = -1 si NPV <= 0 partout (perte totale),
// rate = +inf si NPV reste >= 0, NaN si NPV reste > 0 aux grands taux après
// avoir été négative (flux sans apport initial) ; converged = false dans ces cas.
IrrResult irr(const std::vector<double>& cashflows);

} // namespace lw::finance
