/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * Header-only binary codec used to move items and results across the
 * worker process boundary. Values are written into a flat byte buffer;
 * a type can cross the boundary only if it has a Codec specialization.
 */
namespace Amortize::BinarySerial {

// Safety limits for length prefixes read from a peer
constexpr uint32_t MAX_STRING_BYTES = 64u * 1024u * 1024u;
constexpr uint32_t MAX_VECTOR_ELEMENTS = 64u * 1024u * 1024u;

/**
 * Appends values to a byte buffer owned by the caller
 */
class Writer {
private:
  std::string &m_buffer;

public:
  explicit Writer(std::string &buffer) : m_buffer(buffer) {}

  // Write fundamental types
  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_buffer.append(reinterpret_cast<const char *>(&value), sizeof(T));
    return true;
  }

  bool writeString(const std::string &str) {
    if (str.size() > MAX_STRING_BYTES) {
      SERIAL_ERROR("String too large to encode: " + std::to_string(str.size()) +
                   " bytes");
      return false;
    }
    write(static_cast<uint32_t>(str.size()));
    m_buffer.append(str);
    return true;
  }

  // Write vectors of trivially copyable types in one block
  template <typename T> bool writeVector(const std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if (vec.size() > MAX_VECTOR_ELEMENTS) {
      return false;
    }
    write(static_cast<uint32_t>(vec.size()));
    if (!vec.empty()) {
      m_buffer.append(reinterpret_cast<const char *>(vec.data()),
                      sizeof(T) * vec.size());
    }
    return true;
  }

  size_t size() const { return m_buffer.size(); }
};

/**
 * Reads values back from a byte buffer; every read is bounds checked
 */
class Reader {
private:
  std::string_view m_data;
  size_t m_offset{0};

public:
  explicit Reader(std::string_view data) : m_data(data) {}

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if (remaining() < sizeof(T)) {
      return false;
    }
    std::memcpy(&value, m_data.data() + m_offset, sizeof(T));
    m_offset += sizeof(T);
    return true;
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }
    if (length > MAX_STRING_BYTES || remaining() < length) {
      SERIAL_ERROR("String length out of range: " + std::to_string(length) +
                   " bytes");
      return false;
    }
    str.assign(m_data.data() + m_offset, length);
    m_offset += length;
    return true;
  }

  template <typename T> bool readVector(std::vector<T> &vec) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    uint32_t size = 0;
    if (!read(size)) {
      return false;
    }
    if (size > MAX_VECTOR_ELEMENTS || remaining() / sizeof(T) < size) {
      SERIAL_ERROR("Vector size out of range: " + std::to_string(size) +
                   " elements");
      return false;
    }
    vec.resize(size);
    if (size > 0) {
      std::memcpy(vec.data(), m_data.data() + m_offset, sizeof(T) * size);
      m_offset += sizeof(T) * size;
    }
    return true;
  }

  size_t remaining() const { return m_data.size() - m_offset; }
  bool atEnd() const { return m_offset == m_data.size(); }
};

/**
 * Detects types that provide their own wire format:
 *   bool serialize(BinarySerial::Writer&) const;
 *   bool deserialize(BinarySerial::Reader&);
 */
template <typename T, typename = void>
struct HasSerializeMembers : std::false_type {};

template <typename T>
struct HasSerializeMembers<
    T, std::void_t<decltype(std::declval<const T &>().serialize(
                       std::declval<Writer &>())),
                   decltype(std::declval<T &>().deserialize(
                       std::declval<Reader &>()))>> : std::true_type {};

/**
 * Codec<T> describes how a T crosses the boundary. Types without a
 * specialization report supported == false and are not transferable.
 */
template <typename T, typename Enable = void> struct Codec {
  static constexpr bool supported = false;
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_arithmetic_v<T> || std::is_enum_v<T>>> {
  static constexpr bool supported = true;
  static bool encode(Writer &writer, const T &value) { return writer.write(value); }
  static bool decode(Reader &reader, T &value) { return reader.read(value); }
};

template <typename T>
struct Codec<T, std::enable_if_t<HasSerializeMembers<T>::value &&
                                 std::is_default_constructible_v<T>>> {
  static constexpr bool supported = true;
  static bool encode(Writer &writer, const T &value) { return value.serialize(writer); }
  static bool decode(Reader &reader, T &value) { return value.deserialize(reader); }
};

template <> struct Codec<std::string, void> {
  static constexpr bool supported = true;
  static bool encode(Writer &writer, const std::string &value) {
    return writer.writeString(value);
  }
  static bool decode(Reader &reader, std::string &value) {
    return reader.readString(value);
  }
};

// Element types written as one contiguous block. vector<bool> is
// bit-packed and has no data(), so it goes element by element.
template <typename U>
inline constexpr bool IsBlockCopyable =
    std::is_arithmetic_v<U> && !std::is_same_v<U, bool>;

template <typename U> struct Codec<std::vector<U>, void> {
  static constexpr bool supported = Codec<U>::supported;

  static bool encode(Writer &writer, const std::vector<U> &value) {
    if constexpr (!supported) {
      return false;
    } else if constexpr (IsBlockCopyable<U>) {
      return writer.writeVector(value);
    } else {
      if (value.size() > MAX_VECTOR_ELEMENTS) {
        return false;
      }
      writer.write(static_cast<uint32_t>(value.size()));
      for (const auto &element : value) {
        if (!Codec<U>::encode(writer, element)) {
          return false;
        }
      }
      return true;
    }
  }

  static bool decode(Reader &reader, std::vector<U> &value) {
    if constexpr (!supported) {
      return false;
    } else if constexpr (IsBlockCopyable<U>) {
      return reader.readVector(value);
    } else {
      uint32_t size = 0;
      if (!reader.read(size) || size > MAX_VECTOR_ELEMENTS) {
        return false;
      }
      value.clear();
      value.reserve(size);
      for (uint32_t i = 0; i < size; ++i) {
        U element{};
        if (!Codec<U>::decode(reader, element)) {
          return false;
        }
        value.push_back(std::move(element));
      }
      return true;
    }
  }
};

template <typename A, typename B> struct Codec<std::pair<A, B>, void> {
  static constexpr bool supported = Codec<A>::supported && Codec<B>::supported;

  static bool encode(Writer &writer, const std::pair<A, B> &value) {
    if constexpr (!supported) {
      return false;
    } else {
      return Codec<A>::encode(writer, value.first) &&
             Codec<B>::encode(writer, value.second);
    }
  }

  static bool decode(Reader &reader, std::pair<A, B> &value) {
    if constexpr (!supported) {
      return false;
    } else {
      return Codec<A>::decode(reader, value.first) &&
             Codec<B>::decode(reader, value.second);
    }
  }
};

template <typename T>
inline constexpr bool IsTransferable = Codec<std::decay_t<T>>::supported;

/**
 * Convenience functions for whole batches
 */
template <typename T>
bool encodeBatch(const std::vector<T> &items, std::string &out) {
  static_assert(IsTransferable<T>, "Batch element type has no Codec");
  Writer writer(out);
  return Codec<std::vector<T>>::encode(writer, items);
}

template <typename T>
bool decodeBatch(std::string_view data, std::vector<T> &items) {
  static_assert(IsTransferable<T>, "Batch element type has no Codec");
  Reader reader(data);
  return Codec<std::vector<T>>::decode(reader, items) && reader.atEnd();
}

// Single value round trip used by the transferability check
template <typename T>
bool roundTrip(const T &value, size_t &encodedBytes) {
  if constexpr (!IsTransferable<T>) {
    (void)value;
    encodedBytes = 0;
    return false;
  } else {
    std::string buffer;
    Writer writer(buffer);
    if (!Codec<T>::encode(writer, value)) {
      return false;
    }
    encodedBytes = buffer.size();
    Reader reader(buffer);
    T decoded{};
    return Codec<T>::decode(reader, decoded) && reader.atEnd();
  }
}

} // namespace Amortize::BinarySerial

#endif // BINARY_SERIALIZER_HPP
