#include "intcode/loader.hpp"
#include "intcode/config.hpp"
#include "intcode/errors.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace intcode
{
// Parser de una sola pasada: split por comas, trim y stoll por token.

std::string_view Loader::trim(std::string_view s) {
  std::size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

Word Loader::parse_word(std::string_view token, std::size_t index) {
  const std::string tok(token);
  if (tok.empty())
    throw ParseError("Token vacío en la posición " + std::to_string(index), index);

  std::size_t used = 0;
  long long val = 0;
  try {
    val = std::stoll(tok, &used, 10);
  } catch (const std::logic_error&) {
    // invalid_argument / out_of_range
    throw ParseError("Entero inválido en la posición " + std::to_string(index) + ": \"" + tok + "\"", index);
  }
  if (used != tok.size())
    throw ParseError("Entero inválido en la posición " + std::to_string(index) + ": \"" + tok + "\"", index);
  return static_cast<Word>(val);
}

Program Loader::parse(std::string_view text) {
  const auto body = trim(text);
  if (body.empty()) throw ParseError("Listado vacío");

  Program p;
  p.reserve(body.size() / 2 + 1);

  std::size_t start = 0;
  while (true) {
    const auto comma = body.find(',', start);
    const auto token = trim(body.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
    p.push_back(parse_word(token, p.size()));
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }

  INTCODE_LOG_IF(cfg::kLogLoader, "[Loader] " << p.size() << " celdas cargadas");
  return p;
}

// Parsea desde archivo (lee todo y delega)
Program Loader::parse_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ParseError("No se puede abrir el programa: " + path);
  std::string src((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  INTCODE_LOG_IF(cfg::kLogLoader, "[Loader] leyendo " << path << " (" << src.size() << " bytes)");
  return parse(src);
}

} // namespace intcode
