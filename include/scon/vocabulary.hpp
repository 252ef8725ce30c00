/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared across scon: expected, optional, FixedString,
 *        strong ids and the error enums of the infrastructure modules.
 *
 * Header-only, C++17. No heap allocation, no exceptions.
 */

#ifndef SCON_VOCABULARY_HPP_
#define SCON_VOCABULARY_HPP_

#include "scon/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace scon {

// ============================================================================
// Infrastructure Error Enums
// ============================================================================

enum class TimerError : uint8_t {
  kInvalidPeriod,
  kSlotsFull,
  kNotRunning,
  kAlreadyRunning,
};

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

// ============================================================================
// TimerTaskId (strong type)
// ============================================================================

class TimerTaskId {
 public:
  constexpr TimerTaskId() noexcept : value_(0U) {}
  constexpr explicit TimerTaskId(uint32_t v) noexcept : value_(v) {}

  constexpr uint32_t value() const noexcept { return value_; }
  constexpr bool IsValid() const noexcept { return value_ != 0U; }

  constexpr bool operator==(const TimerTaskId& o) const noexcept {
    return value_ == o.value_;
  }
  constexpr bool operator!=(const TimerTaskId& o) const noexcept {
    return value_ != o.value_;
  }

 private:
  uint32_t value_;  ///< 0 means "no task".
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error return type.
 *
 * Constructed only through the named factories success() / error(), so call
 * sites read as intent. E must be trivially copyable (an enum or small POD).
 */
template <typename V, typename E>
class expected final {
  static_assert(std::is_trivially_copyable<E>::value,
                "expected<V, E>: E must be trivially copyable");

 public:
  static expected success(const V& v) {
    expected r;
    r.Construct(v);
    return r;
  }

  static expected success(V&& v) {
    expected r;
    r.Construct(std::move(v));
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    return r;
  }

  expected(const expected& other) : has_value_(false), error_(other.error_) {
    if (other.has_value_) {
      Construct(other.ValueRef());
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(false), error_(other.error_) {
    if (other.has_value_) {
      Construct(std::move(other.ValueRef()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) {
        Construct(other.ValueRef());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) {
        Construct(std::move(other.ValueRef()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const V& value() const& noexcept {
    SCON_ASSERT(has_value_);
    return ValueRef();
  }
  V& value() & noexcept {
    SCON_ASSERT(has_value_);
    return ValueRef();
  }

  E get_error() const noexcept {
    SCON_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? ValueRef() : fallback;
  }

 private:
  expected() noexcept : has_value_(false), error_{} {}

  template <typename U>
  void Construct(U&& v) {
    ::new (static_cast<void*>(&storage_)) V(std::forward<U>(v));
    has_value_ = true;
  }

  void Destroy() noexcept {
    if (has_value_) {
      ValueRef().~V();
      has_value_ = false;
    }
  }

  V& ValueRef() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& ValueRef() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E error_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    SCON_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), error_(e) {}

  bool has_value_;
  E error_;
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional for trivially copyable T (ids, enums, integers).
 */
template <typename T>
class optional final {
  static_assert(std::is_trivially_copyable<T>::value,
                "optional<T>: T must be trivially copyable");

 public:
  constexpr optional() noexcept : value_{}, has_value_(false) {}
  constexpr optional(T v) noexcept : value_(v), has_value_(true) {}  // NOLINT

  constexpr bool has_value() const noexcept { return has_value_; }
  constexpr explicit operator bool() const noexcept { return has_value_; }

  const T& value() const noexcept {
    SCON_ASSERT(has_value_);
    return value_;
  }

  constexpr T value_or(T fallback) const noexcept {
    return has_value_ ? value_ : fallback;
  }

  void reset() noexcept { has_value_ = false; }

 private:
  T value_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// @brief Tag selecting the truncating FixedString constructor / assign.
struct TruncateToCapacityTag {};
static constexpr TruncateToCapacityTag TruncateToCapacity{};

/**
 * @brief Null-terminated string stored inline, Capacity chars + terminator.
 *
 * Construction from a literal is checked at compile time; runtime strings go
 * through the explicit TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0U, "FixedString capacity must be > 0");

 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(N - 1U) {  // NOLINT
    static_assert(N - 1U <= Capacity, "string literal exceeds capacity");
    std::memcpy(buf_, str, N);
  }

  FixedString(TruncateToCapacityTag, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacityTag, const char* str, uint32_t len) noexcept
      : size_(0U) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacityTag, const char* str) noexcept {
    const uint32_t len =
        (str == nullptr) ? 0U : static_cast<uint32_t>(std::strlen(str));
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacityTag, const char* str, uint32_t len) noexcept {
    size_ = (len > Capacity) ? Capacity : len;
    if (size_ > 0U) {
      std::memcpy(buf_, str, size_);
    }
    buf_[size_] = '\0';
  }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

}  // namespace scon

#endif  // SCON_VOCABULARY_HPP_
