#pragma once
/**
 * @file stats.hpp
 * @brief Moyennes en ligne sur les parties (richesse finale, nombre de coups).
 *
 * Une passe, sans stocker les parties :
 * - mise à jour de Welford pour moyenne et M2 ;
 * - fusion de Chan et al. pour combiner les partiels des workers ;
 * - variance d'échantillon (n-1), erreur standard sqrt(var/n) ;
 * - IC 95 % par approximation normale, z = 1.959963984540054.
 *
 * Petits échantillons :
 *   - n == 0 : mean()=0, variance()=NaN, std_error()=NaN.
 *   - n == 1 : variance()=NaN, std_error()=NaN.
 *   - variance nulle (essais tous identiques) : std_error()=0.
 */

#include <cstddef> // std::size_t

namespace rb {
namespace core {

/// @brief Accumulateur moyenne / variance / extrêmes, fusionnable.
struct RunningStats {
public:
  RunningStats() noexcept;

  /// @brief Prend en compte une observation.
  void add(double x) noexcept;

  /// @brief Absorbe un autre accumulateur (résultat identique à une passe unique, aux arrondis près).
  void merge(const RunningStats& other) noexcept;

  std::size_t count() const noexcept;

  /// @return Moyenne des observations (0 si aucune).
  double mean() const noexcept;

  /// @return Somme des échantillons (mean * n).
  double sum() const noexcept;

  /// @return Plus petit / plus grand échantillon (NaN si n == 0).
  double min() const noexcept;
  double max() const noexcept;

  /// @return Variance empirique non biaisée (NaN si n < 2).
  [[nodiscard]] double variance() const noexcept;

  /// @return Écart-type de la moyenne (NaN si n < 2).
  [[nodiscard]] double std_error() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0};  // Σ (x - mean)²
  double min_{0.0};
  double max_{0.0};
};

/// @brief Bornes [low, high] d’un intervalle de confiance.
struct ConfidenceInterval {
  double low;
  double high;
};

/// @brief Demi-largeur 95 % : z * std_error.
[[nodiscard]] double half_width_95(double std_error) noexcept;

/// @brief IC 95 % symétrique autour de `mean`.
[[nodiscard]] ConfidenceInterval confidence_interval_95(double mean,
                                                        double std_error) noexcept;

} // namespace core
} // namespace rb
