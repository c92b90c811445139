#pragma once
#include "config.hpp"
#include "types.hpp"
#include <cstddef>
#include <vector>

namespace intcode {

/**
 * Memoria plana de palabras de 64b, conceptualmente infinita.
 * - read: fuera de la extensión actual devuelve 0 (no materializa nada).
 * - write: fuera de la extensión crece rellenando con ceros hasta addr inclusive.
 * - Direcciones negativas siempre lanzan AddressError.
 * - limit_ (en palabras) es un techo de cordura; 0 lo desactiva.
 * Tiene semántica de valor: copiar una Memory duplica todo el contenido.
 */
class Memory {
public:
  explicit Memory(std::size_t limit = cfg::kDefaultMemoryLimit);
  explicit Memory(Program image, std::size_t limit = cfg::kDefaultMemoryLimit);

  Word read(Word addr) const;
  void write(Word addr, Word value);

  std::size_t size() const { return cells_.size(); }
  const std::vector<Word>& cells() const { return cells_; }

  std::size_t limit() const { return limit_; }
  void set_limit(std::size_t words) { limit_ = words; }

private:
  std::vector<Word> cells_;   // backing store
  std::size_t       limit_;
};

} // namespace intcode
