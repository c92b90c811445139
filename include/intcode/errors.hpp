#pragma once
#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

//
// Fallos del intérprete. Todos son fatales para la instancia que los lanza:
// no hay rollback parcial de la instrucción. Heredan de Fault para que el
// host pueda atraparlos juntos o distinguirlos por tipo.
//

namespace intcode {

class Fault : public std::runtime_error {
public:
  explicit Fault(const std::string& msg) : std::runtime_error(msg) {}
};

// Texto del programa mal formado (token no entero, listado vacío, archivo ilegible).
class ParseError : public Fault {
public:
  ParseError(const std::string& msg, std::size_t index = 0)
    : Fault(msg), index_(index) {}
  std::size_t index() const { return index_; }
private:
  std::size_t index_;
};

// Opcode o dígito de modo inválido, o escritura a un parámetro inmediato.
class DecodeError : public Fault {
public:
  DecodeError(const std::string& msg, Word pc, Word raw)
    : Fault(msg + " (pc=" + std::to_string(pc) + ", valor=" + std::to_string(raw) + ")"),
      pc_(pc), raw_(raw) {}
  Word pc() const { return pc_; }
  Word raw() const { return raw_; }
private:
  Word pc_;
  Word raw_;
};

// Dirección efectiva negativa o por encima del techo de memoria.
class AddressError : public Fault {
public:
  AddressError(const std::string& msg, Word address)
    : Fault(msg + ": " + std::to_string(address)), address_(address) {}
  Word address() const { return address_; }
private:
  Word address_;
};

// Desborde de la palabra de 64 bits con signo.
class OverflowError : public Fault {
public:
  explicit OverflowError(const std::string& msg) : Fault(msg) {}
};

// Mal uso del protocolo por parte del host.
class ProtocolError : public Fault {
public:
  explicit ProtocolError(const std::string& msg) : Fault(msg) {}
};

// Se superó el techo de pasos configurado.
class StepLimitError : public Fault {
public:
  explicit StepLimitError(std::uint64_t limit)
    : Fault("límite de pasos superado (" + std::to_string(limit) + ")"), limit_(limit) {}
  std::uint64_t limit() const { return limit_; }
private:
  std::uint64_t limit_;
};

} // namespace intcode
