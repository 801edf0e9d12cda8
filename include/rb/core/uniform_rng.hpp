#pragma once
/**
 * @file uniform_rng.hpp
 * @brief Sources de tirages uniformes U[0,1) injectables dans la simulation.
 *
 * # Interface
 * `UniformSource` est la seule dépendance aléatoire du moteur : le pile ou face,
 * la marche et le Monte Carlo reçoivent une référence vers une source, jamais
 * un générateur global.
 *
 * # Implémentations
 * - `UniformRng`  : Mersenne Twister 64 bits, graine explicite.
 * - `SequenceRng` : rejoue une séquence scriptée (tests pas à pas, replay).
 *
 * # Reproductibilité
 * Deux `UniformRng` construits avec la même graine produisent la même séquence.
 * La copie/assignation copie la graine ; l'état interne est reconstruit à
 * partir de cette graine (la copie repart du début de la séquence).
 *
 * # Concurrence
 * Utiliser **une source par thread**. Aucune instance n'est thread-safe.
 */

#include <cstdint>   // std::uint64_t
#include <cstddef>   // std::size_t
#include <memory>
#include <vector>

namespace rb {
namespace core {

/// @brief Source abstraite de tirages uniformes dans [0,1).
class UniformSource {
public:
  virtual ~UniformSource() = default;

  /// @return Un tirage dans [0,1).
  virtual double uniform() = 0;
};

/**
 * @brief Générateur U[0,1) à graine explicite.
 *
 * Implémentation cachée (PIMPL) afin de ne pas exposer <random> dans l’API.
 */
class UniformRng final : public UniformSource {
public:
  /// @brief Construit avec la graine par défaut (fixe, documentée dans le .cpp).
  UniformRng();

  /// @brief Construit avec une graine explicite.
  explicit UniformRng(std::uint64_t seed);

  /// @brief Un tirage U[0,1).
  double uniform() override;

  /// @brief Remplit un buffer de n tirages U[0,1).
  /// @param out pointeur vers un buffer de taille >= n (non nul si n>0).
  void uniform_block(double* out, std::size_t n);

  /// @brief Graine utilisée pour (re)construire l’état interne.
  std::uint64_t seed() const noexcept;

  // Copie "seed-only".
  UniformRng(const UniformRng&);
  UniformRng& operator=(const UniformRng&);

  UniformRng(UniformRng&&) noexcept;
  UniformRng& operator=(UniformRng&&) noexcept;

  ~UniformRng() noexcept override;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
  std::uint64_t seed_;
};

/**
 * @brief Source rejouant une séquence connue de tirages.
 *
 * Chaque valeur doit être dans [0,1). Une fois la séquence consommée :
 * - `cycle == true`  : on repart du début ;
 * - `cycle == false` : `uniform()` lève std::out_of_range.
 */
class SequenceRng final : public UniformSource {
public:
  /// @throws std::invalid_argument si la séquence est vide ou hors de [0,1).
  explicit SequenceRng(std::vector<double> values, bool cycle = false);

  double uniform() override;

  /// @return Nombre de tirages déjà servis.
  std::size_t consumed() const noexcept { return consumed_; }

  /// @return Valeurs restantes avant la fin de la séquence (ou avant le retour au début si cyclique).
  std::size_t remaining() const noexcept;

  /// @brief Revient au début de la séquence.
  void rewind() noexcept { pos_ = 0; consumed_ = 0; }

private:
  std::vector<double> values_;
  std::size_t pos_{0};
  std::size_t consumed_{0};
  bool cycle_;
};

/**
 * @brief Dérive la graine du flux `stream` à partir d’une graine maître.
 *
 * Le flux 0 réutilise la graine maître telle quelle ; les autres passent par
 * un mélange SplitMix64, ce qui donne des flux indépendants par worker.
 */
std::uint64_t derive_seed(std::uint64_t master, std::size_t stream) noexcept;

} // namespace core
} // namespace rb
