#pragma once
#include <cstdint>

namespace intcode {

/**
 * Métricas por máquina.
 * - instructions: instrucciones ejecutadas (halt incluido, bloqueos no).
 * - loads/stores: accesos a memoria al resolver operandos (inmediatos no cuentan).
 * - input_waits: veces que se suspendió por cola de entrada vacía.
 * - max_address: dirección más alta escrita (para dimensionar la memoria).
 */
struct Metrics {
  std::uint64_t instructions = 0;
  std::uint64_t loads = 0;
  std::uint64_t stores = 0;

  std::uint64_t inputs = 0;        // valores consumidos de la cola
  std::uint64_t outputs = 0;       // valores producidos
  std::uint64_t input_waits = 0;

  std::uint64_t jumps_taken = 0;
  std::uint64_t base_adjusts = 0;

  std::int64_t  max_address = -1;

  void reset() { *this = {}; }
};

} // namespace intcode
