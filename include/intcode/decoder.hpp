#pragma once
#include "isa.hpp"
#include "memory.hpp"
#include <string>

//
// Decodificador: celda en pc -> Instr.
//
//   opcode = mem[pc] % 100
//   modo del operando i (1..N) = i-ésimo dígito de mem[pc] / 100
//   valor crudo del operando i = mem[pc + i]
//
// Opcode o dígito de modo fuera de tabla => DecodeError con pc y valor crudo.
//

namespace intcode {

Instr decode(const Memory& mem, Word pc);

// "add [5], #3, rb[+2]": [n]=posición, #n=inmediato, rb[±n]=relativo.
std::string format_param(const Param& p);
std::string format_instr(const Instr& ins);

// Listado lineal desde la celda 0. Las celdas que no decodifican se
// muestran como dato (.word N) y se avanza de a una.
std::string disassemble(const Program& prog);

} // namespace intcode
