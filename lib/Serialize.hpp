#ifndef TALLY_SERIALIZE_HPP
#define TALLY_SERIALIZE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tally {

namespace detail {

template <typename T> static constexpr bool is_pointer_v = std::is_pointer_v<T>;

// Cache endianness detection result - initialized once on first use
inline bool isLittleEndian() {
  static const bool cached = []() {
    const uint16_t test = 0x0102;
    return reinterpret_cast<const uint8_t *>(&test)[0] == 0x02;
  }();
  return cached;
}

template <typename T> T swapBytes(T value) {
  uint8_t *bytes = reinterpret_cast<uint8_t *>(&value);
  constexpr size_t size = sizeof(T);
  for (size_t i = 0; i < size / 2; ++i) {
    std::swap(bytes[i], bytes[size - 1 - i]);
  }
  return value;
}

template <typename T> inline T toBigEndian(T value) {
  static_assert(std::is_same_v<T, uint16_t> || std::is_same_v<T, uint32_t> ||
                    std::is_same_v<T, uint64_t>,
                "toBigEndian only supports uint16_t, uint32_t, and uint64_t");
  if (isLittleEndian()) {
    return swapBytes(value);
  }
  return value;
}

} // namespace detail

/**
 * Write-only binary archive. Integers are big endian, strings and
 * containers are length-prefixed with a uint64_t, optionals carry a
 * presence byte and variants a one-byte alternative index. The encoding is
 * stable across platforms, which makes it usable as a hash preimage.
 *
 * Custom types opt in with
 *   template <typename Archive> void serialize(Archive &ar) const;
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  void write(bool value) {
    uint8_t byte = value ? 1 : 0;
    write(byte);
  }

  void write(uint8_t value) {
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(uint16_t value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(uint32_t value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(uint64_t value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  // 128-bit values go out as high word then low word
  void write(unsigned __int128 value) {
    write(static_cast<uint64_t>(value >> 64));
    write(static_cast<uint64_t>(value));
  }

  void write(const std::string &value) {
    uint64_t size = value.size();
    write(size);
    if (size > 0) {
      os_.write(value.data(), static_cast<std::streamsize>(size));
    }
  }

  template <typename T> void write(const std::optional<T> &value) {
    write(value.has_value());
    if (value) {
      (*this) & *value;
    }
  }

  template <typename T> void write(const std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    uint64_t size = value.size();
    write(size);
    for (const auto &item : value) {
      (*this) & item;
    }
  }

  template <typename... Ts> void write(const std::variant<Ts...> &value) {
    static_assert(sizeof...(Ts) < 256, "Too many variant alternatives");
    write(static_cast<uint8_t>(value.index()));
    std::visit([this](const auto &alt) { (*this) & alt; }, value);
  }

  OutputArchive &operator&(bool value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint8_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint16_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint32_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint64_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(unsigned __int128 value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    write(value);
    return *this;
  }

  template <typename T>
  OutputArchive &operator&(const std::optional<T> &value) {
    write(value);
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    write(value);
    return *this;
  }

  template <typename... Ts>
  OutputArchive &operator&(const std::variant<Ts...> &value) {
    write(value);
    return *this;
  }

  template <typename T>
  auto operator&(const T &value)
      -> decltype(value.template serialize<OutputArchive>(
                      std::declval<OutputArchive &>()),
                  std::declval<OutputArchive &>()) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    value.template serialize<OutputArchive>(*this);
    return *this;
  }

private:
  std::ostream &os_;
};

} // namespace tally

#endif // TALLY_SERIALIZE_HPP
