/**
 * @file port_list.hpp
 * @brief Enumerate candidate serial devices.
 *
 * Scans the device directory for the usual tty name prefixes and annotates
 * each hit with its /dev/serial/by-id alias when one resolves to it.
 */

#ifndef SCON_PORT_LIST_HPP_
#define SCON_PORT_LIST_HPP_

#include "scon/platform.hpp"
#include "scon/serial_port.hpp"
#include "scon/vocabulary.hpp"

#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <dirent.h>

#ifndef SCON_PORT_LIST_MAX
#define SCON_PORT_LIST_MAX 64U
#endif

namespace scon {

struct PortInfo {
  FixedString<SCON_PORT_PATH_MAX> path;
  FixedString<SCON_PORT_PATH_MAX> alias;  ///< by-id name, empty if none.
};

namespace detail {

#if defined(SCON_PLATFORM_MACOS)
static constexpr const char* kTtyPrefixes[] = {"tty.", "cu."};
#else
static constexpr const char* kTtyPrefixes[] = {"ttyUSB", "ttyACM", "ttyS",
                                               "ttyAMA", "rfcomm"};
#endif

inline bool HasTtyPrefix(const char* name) noexcept {
  for (const char* prefix : kTtyPrefixes) {
    if (std::strncmp(name, prefix, std::strlen(prefix)) == 0) {
      return true;
    }
  }
  return false;
}

/// Insert keeping @p ports sorted by path; duplicates are ignored.
inline uint32_t InsertSorted(PortInfo* ports, uint32_t count, uint32_t max,
                             const char* path) noexcept {
  uint32_t pos = 0U;
  while (pos < count && std::strcmp(ports[pos].path.c_str(), path) < 0) {
    ++pos;
  }
  if (pos < count && ports[pos].path == path) {
    return count;
  }
  if (count == max) {
    return count;
  }
  for (uint32_t i = count; i > pos; --i) {
    ports[i] = ports[i - 1U];
  }
  ports[pos] = PortInfo{};
  ports[pos].path.assign(TruncateToCapacity, path);
  return count + 1U;
}

inline void AttachAliases(PortInfo* ports, uint32_t count,
                          const char* by_id_dir) noexcept {
  DIR* dir = ::opendir(by_id_dir);
  if (dir == nullptr) {
    return;
  }
  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr) {
    if (ent->d_name[0] == '.') {
      continue;
    }
    char link[PATH_MAX];
    char target[PATH_MAX];
    (void)std::snprintf(link, sizeof(link), "%s/%s", by_id_dir, ent->d_name);
    if (::realpath(link, target) == nullptr) {
      continue;
    }
    for (uint32_t i = 0U; i < count; ++i) {
      if (ports[i].path == target) {
        ports[i].alias.assign(TruncateToCapacity, ent->d_name);
      }
    }
  }
  (void)::closedir(dir);
}

}  // namespace detail

/**
 * @brief List tty devices under @p dev_dir, sorted by path.
 * @param by_id_dir  Directory of by-id symlinks; nullptr skips aliasing.
 * @return Number of entries written to @p out.
 */
inline uint32_t ListPortsIn(const char* dev_dir, const char* by_id_dir,
                            PortInfo* out, uint32_t max) noexcept {
  DIR* dir = ::opendir(dev_dir);
  if (dir == nullptr) {
    return 0U;
  }
  uint32_t count = 0U;
  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr) {
    if (!detail::HasTtyPrefix(ent->d_name)) {
      continue;
    }
    char path[PATH_MAX];
    (void)std::snprintf(path, sizeof(path), "%s/%s", dev_dir, ent->d_name);
    count = detail::InsertSorted(out, count, max, path);
  }
  (void)::closedir(dir);
  if (by_id_dir != nullptr) {
    detail::AttachAliases(out, count, by_id_dir);
  }
  return count;
}

inline uint32_t ListPorts(PortInfo* out, uint32_t max) noexcept {
  return ListPortsIn("/dev", "/dev/serial/by-id", out, max);
}

}  // namespace scon

#endif  // SCON_PORT_LIST_HPP_
