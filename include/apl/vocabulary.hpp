/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString.
 *
 * No heap allocation and no exceptions: errors travel as values, fixed-size
 * text lives inline. Precondition violations (value() on an error, access to
 * an empty optional) trip APL_ASSERT.
 */

#ifndef APL_VOCABULARY_HPP_
#define APL_VOCABULARY_HPP_

#include "apl/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace apl {

// ============================================================================
// Error enums shared by several modules
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Either a value of type V or an error of type E.
 *
 * Constructed only through the named factories success() and error().
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected r(ValueTag{});
    ::new (static_cast<void*>(&r.value_)) V(val);
    return r;
  }

  static expected success(V&& val) {
    expected r(ValueTag{});
    ::new (static_cast<void*>(&r.value_)) V(std::move(val));
    return r;
  }

  static expected error(E err) noexcept {
    expected r(ErrorTag{});
    r.error_ = err;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    APL_ASSERT(has_value_);
    return value_;
  }

  const V& value() const& noexcept {
    APL_ASSERT(has_value_);
    return value_;
  }

  V&& value() && noexcept {
    APL_ASSERT(has_value_);
    return std::move(value_);
  }

  E get_error() const noexcept {
    APL_ASSERT(!has_value_);
    return error_;
  }

  V value_or(const V& fallback) const& {
    return has_value_ ? value_ : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  explicit expected(ValueTag) noexcept : has_value_(true) {}
  explicit expected(ErrorTag) noexcept : error_(), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    APL_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected(bool ok, E err) noexcept : error_(err), has_value_(ok) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : empty_(), has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT
    ::new (static_cast<void*>(&value_)) T(val);
  }

  optional(T&& val) : has_value_(true) {  // NOLINT
    ::new (static_cast<void*>(&value_)) T(std::move(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(other.value_);
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    APL_ASSERT(has_value_);
    return value_;
  }

  const T& value() const& noexcept {
    APL_ASSERT(has_value_);
    return value_;
  }

  T&& value() && noexcept {
    APL_ASSERT(has_value_);
    return std::move(value_);
  }

  T value_or(const T& fallback) const& {
    return has_value_ ? value_ : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

 private:
  struct Empty {};

  union {
    Empty empty_;
    T value_;
  };
  bool has_value_;
};

template <typename T>
inline bool operator==(const optional<T>& a, const optional<T>& b) {
  if (a.has_value() != b.has_value()) return false;
  return !a.has_value() || a.value() == b.value();
}

template <typename T>
inline bool operator!=(const optional<T>& a, const optional<T>& b) {
  return !(a == b);
}

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating FixedString constructor for runtime text.
struct TruncateToCapacity_t {};
inline constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Fixed-capacity, null-terminated string stored inline.
 *
 * Literals are length-checked at compile time. Runtime text must opt into
 * truncation explicitly with TruncateToCapacity.
 */
template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0, "FixedString capacity must be non-zero");

 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(N - 1) {  // NOLINT
    static_assert(N - 1 <= Capacity, "string literal exceeds capacity");
    std::memcpy(buf_, str, N - 1);
    buf_[size_] = '\0';
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    uint32_t len = 0;
    if (str != nullptr) {
      while (len < Capacity && str[len] != '\0') ++len;
    }
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    size_ = (str == nullptr) ? 0U : (len < Capacity ? len : Capacity);
    if (size_ > 0) std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() &&
           std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* str) const noexcept {
    return str != nullptr && std::strcmp(buf_, str) == 0;
  }

  bool operator!=(const char* str) const noexcept { return !(*this == str); }

  bool operator<(const FixedString& other) const noexcept {
    return std::strcmp(buf_, other.buf_) < 0;
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_;
};

}  // namespace apl

#endif  // APL_VOCABULARY_HPP_
