#ifndef MIDEA_HEX_HPP
#define MIDEA_HEX_HPP

#include <string>

#include <midea/defs.hpp>

namespace midea {

std::string to_hex(const Bytes& data);

/// Throws std::invalid_argument for odd length or non-hex characters.
Bytes from_hex(const std::string& hex);

} // namespace midea

#endif // MIDEA_HEX_HPP
