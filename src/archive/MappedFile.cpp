/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "archive/MappedFile.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace DexVault {

MappedFile::~MappedFile() { close(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : m_fd(other.m_fd), m_data(other.m_data), m_size(other.m_size) {
  other.m_fd = -1;
  other.m_data = nullptr;
  other.m_size = 0;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
    m_fd = other.m_fd;
    m_data = other.m_data;
    m_size = other.m_size;
    other.m_fd = -1;
    other.m_data = nullptr;
    other.m_size = 0;
  }
  return *this;
}

void MappedFile::close() {
  if (m_data != nullptr) {
    ::munmap(const_cast<uint8_t *>(m_data), m_size);
  }
  if (m_fd >= 0) {
    ::close(m_fd);
  }
  m_fd = -1;
  m_data = nullptr;
  m_size = 0;
}

MappedFile::Result MappedFile::open(const std::string &path,
                                    std::string &error) {
  close();

  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    error = std::format("cannot open {}: {}", path, std::strerror(err));
    return err == ENOENT ? Result::NotFound : Result::OpenFailed;
  }

  struct stat info {};
  if (::fstat(fd, &info) != 0) {
    error = std::format("cannot stat {}: {}", path, std::strerror(errno));
    ::close(fd);
    return Result::OpenFailed;
  }

  size_t size = static_cast<size_t>(info.st_size);
  const uint8_t *data = nullptr;
  if (size > 0) {
    void *mapped = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapped == MAP_FAILED) {
      error = std::format("mmap failed for {}: {}", path, std::strerror(errno));
      ::close(fd);
      return Result::MapFailed;
    }
    data = static_cast<const uint8_t *>(mapped);
  }

  m_fd = fd;
  m_data = data;
  m_size = size;
  return Result::Ok;
}

} // namespace DexVault
