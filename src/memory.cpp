#include "intcode/memory.hpp"
#include "intcode/errors.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace intcode {

Memory::Memory(std::size_t limit) : limit_(limit) {}

Memory::Memory(Program image, std::size_t limit) : cells_(std::move(image)), limit_(limit) {}

Word Memory::read(Word addr) const {
  if (addr < 0) throw AddressError("lectura en dirección negativa", addr);
  const auto idx = static_cast<std::uint64_t>(addr);
  if (idx >= cells_.size()) return 0;
  return cells_[idx];
}

void Memory::write(Word addr, Word value) {
  if (addr < 0) throw AddressError("escritura en dirección negativa", addr);
  const auto idx = static_cast<std::uint64_t>(addr);
  if (limit_ != 0 && idx >= limit_)
    throw AddressError("escritura por encima del techo de memoria (" + std::to_string(limit_) + " palabras)", addr);
  if (idx >= cells_.size()) cells_.resize(idx + 1, 0);
  cells_[idx] = value;
}

} // namespace intcode
