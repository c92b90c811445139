#pragma once
#include "types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

namespace intcode {

// Opcodes: el valor del enum es el código numérico (celda % 100).
enum class OpCode : std::uint8_t {
  Add                = 1,   // c = a + b
  Multiply           = 2,   // c = a * b
  Input              = 3,   // a = cola.front()
  Output             = 4,   // salida = a
  JumpIfTrue         = 5,   // if a != 0: pc = b
  JumpIfFalse        = 6,   // if a == 0: pc = b
  LessThan           = 7,   // c = a < b
  Equals             = 8,   // c = a == b
  AdjustRelativeBase = 9,   // rb += a
  Halt               = 99
};

// Modo de direccionamiento (dígito decimal del parámetro).
enum class Mode : std::uint8_t {
  Position  = 0,  // valor = dirección
  Immediate = 1,  // valor = operando (no se puede escribir)
  Relative  = 2   // valor = desplazamiento sobre la base relativa
};

// Parámetro crudo: se resuelve recién al usarse (load/store).
struct Param {
  Mode mode{Mode::Position};
  Word value{0};
};

// Instrucción decodificada. Sólo los primeros argc parámetros son válidos.
struct Instr {
  OpCode               op{OpCode::Halt};
  std::array<Param, 3> params{};
  std::size_t          argc{0};
};

constexpr bool is_opcode(Word code) {
  return (code >= 1 && code <= 9) || code == 99;
}

constexpr bool is_mode(Word digit) { return digit >= 0 && digit <= 2; }

// Cantidad de operandos por opcode.
constexpr std::size_t arity(OpCode op) {
  switch (op) {
    case OpCode::Add:
    case OpCode::Multiply:
    case OpCode::LessThan:
    case OpCode::Equals:
      return 3;
    case OpCode::JumpIfTrue:
    case OpCode::JumpIfFalse:
      return 2;
    case OpCode::Input:
    case OpCode::Output:
    case OpCode::AdjustRelativeBase:
      return 1;
    case OpCode::Halt:
      return 0;
  }
  return 0;
}

// Avance de pc. Halt no avanza: la máquina queda terminada en su lugar.
constexpr Word size_of(OpCode op) {
  return op == OpCode::Halt ? 0 : static_cast<Word>(arity(op)) + 1;
}

inline const char* mnemonic(OpCode op) {
  switch (op) {
    case OpCode::Add:                return "add";
    case OpCode::Multiply:           return "mul";
    case OpCode::Input:              return "in";
    case OpCode::Output:             return "out";
    case OpCode::JumpIfTrue:         return "jnz";
    case OpCode::JumpIfFalse:        return "jz";
    case OpCode::LessThan:           return "lt";
    case OpCode::Equals:             return "eq";
    case OpCode::AdjustRelativeBase: return "arb";
    case OpCode::Halt:               return "halt";
  }
  return "?";
}

} // namespace intcode
