#pragma once
/**
 * Console: host interactivo para una sola Machine.
 *   - run_batch: imprime cada salida como entero; si falta entrada la lee de `in`.
 *   - run_ascii: texto ASCII en ambos sentidos (una línea de `in` = una entrada + '\n').
 *   - run_stepping: ENTER=step | c=continuar | r=regs | m [addr [n]]=memoria |
 *                   i N=encolar entrada | q=salir  (implementado en stepping_ui.cpp)
 * Devuelven 0 si la máquina terminó y 1 si la entrada se agotó antes.
 */

#include "machine.hpp"
#include "types.hpp"
#include <cstddef>
#include <iostream>
#include <string>

namespace intcode {

class Console {
public:
  explicit Console(Machine machine, std::istream& in = std::cin, std::ostream& out = std::cout);

  // ---- Modos
  int run_batch();
  int run_ascii();
  int run_stepping();

  // ---- Stepping
  StepState step_one();        // 1 instrucción con decode, diffs y salida

  // ---- Utilidades
  void dump_regs() const;
  void dump_memory(Word from, std::size_t count) const;
  void dump_metrics() const;

  Machine&       machine() { return m_; }
  const Machine& machine() const { return m_; }

private:
  Machine       m_;
  std::istream& in_;
  std::ostream& out_;
};

} // namespace intcode
