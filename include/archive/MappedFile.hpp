/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAPPED_FILE_HPP
#define MAPPED_FILE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace DexVault {

/**
 * @brief Read-only memory mapping of a whole file (RAII)
 *
 * Move-only; the mapping is released in the destructor. An empty file maps
 * to a valid object with size() == 0 and data() == nullptr.
 */
class MappedFile {
public:
  enum class Result { Ok, NotFound, OpenFailed, MapFailed };

  MappedFile() = default;
  ~MappedFile();
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  /**
   * @brief Maps the file at path, replacing any current mapping
   * @param error receives a description when the result is not Ok
   */
  Result open(const std::string &path, std::string &error);

  const uint8_t *data() const { return m_data; }
  size_t size() const { return m_size; }
  bool isOpen() const { return m_fd >= 0; }

private:
  void close();

  int m_fd{-1};
  const uint8_t *m_data{nullptr};
  size_t m_size{0};
};

} // namespace DexVault

#endif // MAPPED_FILE_HPP
