#pragma once
#include "config.hpp"
#include "isa.hpp"
#include "memory.hpp"
#include "metrics.hpp"
#include "types.hpp"
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace intcode {

// E/S por callbacks: run_with() pide un valor cuando la cola está vacía y
// entrega cada salida apenas se produce.
class MachineIO {
public:
  virtual ~MachineIO() = default;
  virtual Word input() = 0;
  virtual void output(Word value) = 0;
};

/**
 * Intérprete Intcode con ejecución suspendible.
 *
 * Todo el estado (memoria, pc, base relativa, cola de entrada, salida
 * pendiente) vive en la instancia, así que step()/run() pueden retomarse
 * en cualquier momento y una copia (clone) evoluciona de forma independiente.
 *
 * Protocolo:
 * - Input con cola vacía: BlockedOnInput sin tocar nada; se reintenta.
 * - Output: deja el valor pendiente y devuelve BlockedOnOutput. Mientras haya
 *   una salida pendiente, step() no ejecuta y vuelve a devolver BlockedOnOutput.
 * - Halt: Finished, terminal. step() sobre una máquina terminada es ProtocolError.
 */
class Machine {
public:
  explicit Machine(Program program, MachineOptions opts = {});

  static Machine from_text(std::string_view text, MachineOptions opts = {});
  static Machine from_file(const std::string& path, MachineOptions opts = {});

  // ---- Entrada
  void append_input(Word value);
  void append_input(std::initializer_list<Word> values);
  void append_input(const std::vector<Word>& values);
  void append_ascii(std::string_view text);   // un valor por carácter

  // ---- Ejecución
  StepState step();
  RunState  run();                            // hasta el próximo estado != Running
  StepState run_for(std::uint64_t max_steps); // Running si se agotó el presupuesto
  void      run_with(MachineIO& io);          // hasta Finished

  // ---- Salida
  Word                take_output();
  bool                has_output() const { return output_.has_value(); }
  std::optional<Word> peek_output() const { return output_; }
  std::vector<Word>   read_output();          // drena hasta bloquear en input o terminar
  std::optional<std::string> read_ascii();

  // ---- Memoria
  void poke(Word addr, Word value);
  Word peek(Word addr) const;

  Machine clone() const { return *this; }

  // ---- Consultas
  Word                  pc() const { return pc_; }
  Word                  relative_base() const { return rb_; }
  bool                  finished() const { return finished_; }
  std::uint64_t         steps() const { return steps_; }
  std::size_t           pending_input() const { return input_.size(); }
  const Memory&         memory() const { return mem_; }
  const Metrics&        metrics() const { return metrics_; }
  const MachineOptions& options() const { return opts_; }
  const std::string&    name() const { return opts_.name; }
  void                  set_trace(bool on) { opts_.trace = on; }
  void                  set_name(std::string name) { opts_.name = std::move(name); }

private:
  // Resolución de operandos
  Word effective_address(const Param& p) const;
  Word load(const Param& p);
  void store(const Param& p, Word value);

  // Aritmética con detección de desborde
  Word checked_add(Word a, Word b, const char* what) const;
  Word checked_mul(Word a, Word b, const char* what) const;

  // Estado
  Memory             mem_;
  Word               pc_ = 0;
  Word               rb_ = 0;
  std::deque<Word>   input_;
  std::optional<Word> output_;
  bool               finished_ = false;
  std::uint64_t      steps_ = 0;

  MachineOptions     opts_;
  Metrics            metrics_{};
};

} // namespace intcode
