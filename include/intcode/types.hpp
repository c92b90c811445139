#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace intcode {

using Word    = std::int64_t;        // celda de memoria, valor y dirección
using Program = std::vector<Word>;   // listado ya parseado (celdas 0..N-1)

// Resultado de un único paso de decodificación/ejecución.
enum class StepState : std::uint8_t {
  Running,          // ejecutó una instrucción y puede seguir
  BlockedOnInput,   // cola de entrada vacía: el host debe proveer datos
  BlockedOnOutput,  // hay una salida sin consumir: el host debe tomarla
  Finished          // ejecutó 99; terminal
};

// Resultado de run(): nunca Running.
enum class RunState : std::uint8_t { BlockedOnInput, BlockedOnOutput, Finished };

inline const char* to_string(StepState s) {
  switch (s) {
    case StepState::Running:         return "Running";
    case StepState::BlockedOnInput:  return "BlockedOnInput";
    case StepState::BlockedOnOutput: return "BlockedOnOutput";
    case StepState::Finished:        return "Finished";
  }
  return "?";
}

inline const char* to_string(RunState s) {
  switch (s) {
    case RunState::BlockedOnInput:  return "BlockedOnInput";
    case RunState::BlockedOnOutput: return "BlockedOnOutput";
    case RunState::Finished:        return "Finished";
  }
  return "?";
}

// Running no tiene equivalente: run() nunca lo devuelve.
inline RunState to_run_state(StepState s) {
  switch (s) {
    case StepState::BlockedOnInput:  return RunState::BlockedOnInput;
    case StepState::BlockedOnOutput: return RunState::BlockedOnOutput;
    case StepState::Finished:        return RunState::Finished;
    case StepState::Running:         break;
  }
  throw std::invalid_argument("to_run_state: Running no es un estado de suspensión");
}

} // namespace intcode
