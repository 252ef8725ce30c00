/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend
 *        dispatch.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih          (SCON_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (SCON_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (SCON_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Keys given on the
 * command line are layered on top with Set().
 *
 * Usage:
 * @code
 *   scon::Config<scon::IniBackend> cfg;
 *   cfg.LoadFile("scon.ini");
 *   uint32_t baud = cfg.GetUint32("serial", "baud", 115200U);
 * @endcode
 */

#ifndef SCON_CONFIG_HPP_
#define SCON_CONFIG_HPP_

#include "scon/platform.hpp"
#include "scon/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef SCON_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef SCON_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef SCON_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef SCON_CONFIG_MAX_FILE_SIZE
#define SCON_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace scon {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend Tag Types
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") ||
           detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64U;
  static constexpr uint32_t kMaxKeyLen = 48U;
  static constexpr uint32_t kMaxValueLen = 256U;

  // --- Typed Getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const optional<int32_t> v = FindInt(section, key);
    return v.value_or(default_val);
  }

  /// @brief Negative or malformed values yield @p default_val.
  uint32_t GetUint32(const char* section, const char* key,
                     uint32_t default_val = 0U) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return default_val;
    }
    char* end = nullptr;
    const long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value || val < 0 || val > 0xFFFFFFFFLL) {
      return default_val;
    }
    return static_cast<uint32_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  // --- Optional Getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return {};
    }
    char* end = nullptr;
    const long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? optional<int32_t>{}
                             : optional<int32_t>{static_cast<int32_t>(val)};
  }

  /// @brief true/1/yes/on and false/0/no/off; anything else is absent.
  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return {};
    }
    return ParseBool(e->value);
  }

  // --- Mutation ---

  /// @brief Add or replace one value (command-line overrides).
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    SCON_ASSERT(section != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section)) {
        return true;
      }
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  static optional<bool> ParseBool(const char* str) noexcept {
    if (str == nullptr) {
      return {};
    }
    if (detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
        detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on")) {
      return true;
    }
    if (detail::StrCaseEqual(str, "false") || detail::StrCaseEqual(str, "0") ||
        detail::StrCaseEqual(str, "no") || detail::StrCaseEqual(str, "off")) {
      return false;
    }
    return {};
  }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) {
      return false;
    }
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path,
                                                          char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    SCON_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0U;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) {
      return nullptr;
    }
    return dot + 1;
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0U;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend compiled out: every call reports kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SCON_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  /// inih: non-zero keeps parsing, zero flags the line as an error.
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section != nullptr ? section : "",
                       name != nullptr ? name : "",
                       value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef SCON_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[SCON_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!Add(store, it.key().c_str(), kit.key().c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", it.key().c_str(), *it)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const nlohmann::json& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_ref<const std::string&>().c_str(),
                            sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get<bool>() ? "true" : "false", sizeof(val));
    } else if (n.is_number_integer()) {
      (void)std::snprintf(val, sizeof(val), "%lld",
                          static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      (void)std::snprintf(val, sizeof(val), "%g", n.get<double>());
    } else {
      ConfigStore::SafeCopy(val, n.dump().c_str(), sizeof(val));
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

#ifdef SCON_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[SCON_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    const std::string text(data, size);
    auto root = fkyaml::node::deserialize(text);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const auto key = kit.key().get_value<std::string>();
          if (!Add(store, sec.c_str(), key.c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", sec.c_str(), node)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const fkyaml::node& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_value<std::string>().c_str(),
                            sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get_value<bool>() ? "true" : "false",
                            sizeof(val));
    } else if (n.is_integer()) {
      (void)std::snprintf(val, sizeof(val), "%lld",
                          static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      (void)std::snprintf(val, sizeof(val), "%g", n.get_value<double>());
    } else {
      val[0] = '\0';
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    SCON_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      format = DetectFormat(path);
    }
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    SCON_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) {
      return Head::kFormat;
    }
    return DetectExt<Backends...>(ext);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) {
      return First::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

/// @brief Every backend this build enables; unknown extensions fall to INI.
using ConsoleConfig = Config<IniBackend, JsonBackend, YamlBackend>;

}  // namespace scon

#endif  // SCON_CONFIG_HPP_
