#ifndef TALLY_BINARY_PACK_HPP
#define TALLY_BINARY_PACK_HPP

#include "Serialize.hpp"

#include <sstream>
#include <string>

namespace tally {
namespace utl {

/**
 * Pack a struct/object to binary string using OutputArchive
 * @param t The object to serialize
 * @return Binary string representation
 */
template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

} // namespace utl
} // namespace tally

#endif // TALLY_BINARY_PACK_HPP
