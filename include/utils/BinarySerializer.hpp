/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

/**
 * Header-only helpers for building and reading fixed-layout binary images
 * in memory. Values are copied byte-wise in host order, so only trivially
 * copyable types are accepted.
 */
namespace DexVault::BinarySerial {

/**
 * Growable byte buffer with offset-based patching
 */
class Writer {
private:
  std::vector<uint8_t> m_buffer;

public:
  Writer() = default;
  explicit Writer(size_t reserveBytes) { m_buffer.reserve(reserveBytes); }

  size_t size() const { return m_buffer.size(); }
  const std::vector<uint8_t> &buffer() const { return m_buffer; }
  std::vector<uint8_t> release() { return std::move(m_buffer); }

  // Append a value, returns the offset it was written at
  template <typename T> size_t write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    size_t offset = m_buffer.size();
    m_buffer.resize(offset + sizeof(T));
    std::memcpy(m_buffer.data() + offset, &value, sizeof(T));
    return offset;
  }

  size_t writeBytes(const void *data, size_t length) {
    size_t offset = m_buffer.size();
    if (length > 0) {
      const auto *bytes = static_cast<const uint8_t *>(data);
      m_buffer.insert(m_buffer.end(), bytes, bytes + length);
    }
    return offset;
  }

  size_t writeString(std::string_view text) {
    return writeBytes(text.data(), text.size());
  }

  // Zero-filled space for count values of T, filled in later with patch()
  template <typename T> size_t reserve(size_t count = 1) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    size_t offset = m_buffer.size();
    m_buffer.resize(offset + sizeof(T) * count, 0);
    return offset;
  }

  template <typename T> void patch(size_t offset, const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    std::memcpy(m_buffer.data() + offset, &value, sizeof(T));
  }

  // Pad with zeros up to the next multiple of alignment
  void align(size_t alignment) {
    size_t remainder = m_buffer.size() % alignment;
    if (remainder != 0) {
      m_buffer.resize(m_buffer.size() + (alignment - remainder), 0);
    }
  }
};

/**
 * Bounds-checked reads from a borrowed byte range
 */
class Reader {
private:
  const uint8_t *m_data{nullptr};
  size_t m_size{0};

public:
  Reader() = default;
  Reader(const uint8_t *data, size_t size) : m_data(data), m_size(size) {}

  size_t size() const { return m_size; }
  const uint8_t *data() const { return m_data; }

  bool contains(size_t offset, size_t length) const {
    return offset <= m_size && length <= m_size - offset;
  }

  template <typename T> std::optional<T> read(size_t offset) const {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    if (!contains(offset, sizeof(T))) {
      return std::nullopt;
    }
    T value;
    std::memcpy(&value, m_data + offset, sizeof(T));
    return value;
  }

  // Sub-range [offset, offset + length), empty reader when out of bounds
  Reader slice(size_t offset, size_t length) const {
    if (!contains(offset, length)) {
      return Reader();
    }
    return Reader(m_data + offset, length);
  }

  std::optional<std::string_view> readString(size_t offset,
                                             size_t length) const {
    if (!contains(offset, length)) {
      return std::nullopt;
    }
    return std::string_view(reinterpret_cast<const char *>(m_data + offset),
                            length);
  }
};

// Unique per call so concurrent writers to one path never share a temp file
inline std::filesystem::path tempPathFor(const std::filesystem::path &path) {
  static std::atomic<uint64_t> s_tempCounter{0};
  std::filesystem::path tmp = path;
  tmp += "." + std::to_string(s_tempCounter.fetch_add(1, std::memory_order_relaxed)) + ".tmp";
  return tmp;
}

/**
 * Write bytes to <path>.<n>.tmp, then rename over path. On failure the
 * previous file at path is left untouched and error describes what went wrong.
 * Concurrent writers each rename a complete file; the last rename wins.
 */
inline bool writeFileAtomic(const std::filesystem::path &path,
                            const uint8_t *data, size_t length,
                            std::string &error) {
  error.clear();

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      error = "Cannot create directory " + path.parent_path().string() + ": " +
              ec.message();
      return false;
    }
  }

  const std::filesystem::path tmp = tempPathFor(path);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "Cannot open " + tmp.string() + " for writing";
      return false;
    }
    if (length > 0) {
      out.write(reinterpret_cast<const char *>(data),
                static_cast<std::streamsize>(length));
    }
    out.flush();
    out.close();
    if (!out) {
      error = "Failed to write " + tmp.string();
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    error = "Failed to rename " + tmp.string() + ": " + ec.message();
    std::error_code removeEc;
    std::filesystem::remove(tmp, removeEc);
    return false;
  }
  return true;
}

inline bool writeFileAtomic(const std::filesystem::path &path,
                            const std::vector<uint8_t> &bytes,
                            std::string &error) {
  return writeFileAtomic(path, bytes.data(), bytes.size(), error);
}

} // namespace DexVault::BinarySerial

#endif // BINARY_SERIALIZER_HPP
