#pragma once
/**
 * Pipeline: encadena N máquinas clonadas de una plantilla.
 * Un solo hilo, round-robin: la salida de la etapa i es entrada de la i+1.
 * Con feedback, la última etapa vuelve a alimentar a la etapa 0 hasta que
 * la última termina.
 */

#include "machine.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace intcode {

class Pipeline {
public:
  // primes[i] = entradas iniciales de la etapa i (p.ej. su fase)
  Pipeline(const Machine& tmpl, const std::vector<std::vector<Word>>& primes, bool feedback = false);

  // Inyecta signal en la etapa 0 y corre hasta que la última etapa termina.
  // Devuelve el último valor que emitió la última etapa.
  // Un solo uso: si la última etapa ya terminó lanza ProtocolError.
  Word run(Word signal);

  std::size_t    size() const { return stages_.size(); }
  const Machine& stage(std::size_t i) const { return stages_.at(i); }
  bool           feedback() const { return feedback_; }

private:
  // Corre la etapa i hasta bloquear/terminar y reparte sus salidas.
  void pump(std::size_t i);

  std::vector<Machine> stages_;
  bool                 feedback_;

  std::optional<Word>  last_;   // última salida de la última etapa
};

} // namespace intcode
