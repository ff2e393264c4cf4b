#ifndef ARGGUARD_GUARD_GUARD_HPP_
#define ARGGUARD_GUARD_GUARD_HPP_

#include "core/errors/guard_error.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace argguard::guard {

using core::errors::ArgumentError;
using core::errors::ArgumentNullError;
using core::errors::InvalidStateError;

inline constexpr std::string_view kArgumentWasEmpty = "Argument was empty";

namespace detail {

// Handle types with an "absent" state. Everything else is never absent.
template <typename T>
struct NullableTraits : std::false_type {};

template <typename T>
struct NullableTraits<T*> : std::true_type {
  static bool IsNull(const T* value) {
    return value == nullptr;
  }
};

template <typename T>
struct NullableTraits<std::shared_ptr<T>> : std::true_type {
  static bool IsNull(const std::shared_ptr<T>& value) {
    return value == nullptr;
  }
};

template <typename T, typename Deleter>
struct NullableTraits<std::unique_ptr<T, Deleter>> : std::true_type {
  static bool IsNull(const std::unique_ptr<T, Deleter>& value) {
    return value == nullptr;
  }
};

template <typename T>
struct NullableTraits<std::optional<T>> : std::true_type {
  static bool IsNull(const std::optional<T>& value) {
    return !value.has_value();
  }
};

template <typename Signature>
struct NullableTraits<std::function<Signature>> : std::true_type {
  static bool IsNull(const std::function<Signature>& value) {
    return !value;
  }
};

template <typename T>
using Bare = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T>
inline constexpr bool kIsNullable = NullableTraits<Bare<T>>::value;

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool kIsOptional = IsOptional<Bare<T>>::value;

// Nullable handles accepted by the reference-type overloads. Optionals have
// their own unwrapping overloads.
template <typename T>
using EnableIfHandle = std::enable_if_t<kIsNullable<T> && !kIsOptional<T>, int>;

template <typename T>
bool IsNull(const T& value) {
  return NullableTraits<Bare<T>>::IsNull(value);
}

template <typename C>
inline constexpr bool kIsCharacter =
    std::is_same_v<C, char> || std::is_same_v<C, wchar_t> || std::is_same_v<C, char8_t> ||
    std::is_same_v<C, char16_t> || std::is_same_v<C, char32_t>;

// "No first element". Character arrays are C strings, so a leading NUL is empty.
template <typename Sequence>
bool IsEmptySequence(const Sequence& sequence) {
  if constexpr (std::is_array_v<Sequence> &&
                kIsCharacter<std::remove_cv_t<std::remove_extent_t<Sequence>>>) {
    return sequence[0] == 0;
  } else {
    using std::begin;
    using std::end;
    return !(begin(sequence) != end(sequence));
  }
}

// Emptiness of what a present handle refers to. Character pointers are C strings.
template <typename Handle>
bool IsEmptyReferent(const Handle& handle) {
  using Referent = Bare<decltype(*handle)>;
  if constexpr (kIsCharacter<Referent>) {
    return *handle == 0;
  } else {
    return IsEmptySequence(*handle);
  }
}

template <typename E, typename = void>
struct HasToString : std::false_type {};

template <typename E>
struct HasToString<E, std::void_t<decltype(ToString(std::declval<E>()))>> : std::true_type {};

// Enums with an ADL-visible ToString() print by name, others by number.
template <typename E>
std::string FormatEnumValue(E value) {
  if constexpr (HasToString<E>::value) {
    return std::string(ToString(value));
  } else {
    return std::to_string(static_cast<std::underlying_type_t<E>>(value));
  }
}

template <typename E, typename Set>
std::string DescribeEnumNotInSet(E value, const Set& valid_values) {
  std::string message = "Enum value " + FormatEnumValue(value) + " not in valid set: [";
  bool first = true;
  for (const E& valid : valid_values) {
    if (!first) {
      message += ',';
    }
    message += FormatEnumValue(valid);
    first = false;
  }
  message += ']';
  return message;
}

} // namespace detail

// Guards return the validated argument unchanged. Lvalue arguments come back
// by reference to the caller's object; rvalues are moved into the result.

// Ensures that an enum value is one of `valid_values` (any iterable container).
// Throws ArgumentError listing the valid set otherwise.
template <typename E, typename Set>
E ArgumentEnumValid(E arg_value, const Set& valid_values, std::string_view arg_name = {}) {
  static_assert(std::is_enum_v<E>, "ArgumentEnumValid requires an enum type");

  using std::begin;
  using std::end;
  const auto last = end(valid_values);
  if (std::find(begin(valid_values), last, arg_value) == last) {
    throw ArgumentError(detail::DescribeEnumNotInSet(arg_value, valid_values), arg_name);
  }

  return arg_value;
}

template <typename E>
E ArgumentEnumValid(E arg_value, std::initializer_list<E> valid_values,
                    std::string_view arg_name = {}) {
  return ArgumentEnumValid<E, std::initializer_list<E>>(arg_value, valid_values, arg_name);
}

// Ensures that an optional value is engaged and returns the contained value.
template <typename T>
T ArgumentNotNull(const std::optional<T>& arg_value, std::string_view arg_name = {}) {
  if (!arg_value.has_value()) {
    throw ArgumentNullError(arg_name);
  }

  return *arg_value;
}

template <typename T>
T ArgumentNotNull(std::optional<T>&& arg_value, std::string_view arg_name = {}) {
  if (!arg_value.has_value()) {
    throw ArgumentNullError(arg_name);
  }

  return std::move(*arg_value);
}

// Ensures that a pointer-like handle (raw/smart pointer, std::function) is set.
template <typename T, detail::EnableIfHandle<T> = 0>
T ArgumentNotNull(T&& arg_value, std::string_view arg_name = {}) {
  if (detail::IsNull(arg_value)) {
    throw ArgumentNullError(arg_name);
  }

  return std::forward<T>(arg_value);
}

// Same as ArgumentNotNull, with a caller-supplied message on failure.
template <typename T, detail::EnableIfHandle<T> = 0>
T ArgumentNotNullWithMessage(std::string_view message, T&& arg_value,
                             std::string_view arg_name = {}) {
  if (detail::IsNull(arg_value)) {
    throw ArgumentNullError(arg_name, std::string(message));
  }

  return std::forward<T>(arg_value);
}

// Ensures that a sequence is present and has at least one element.
//
// Accepts a container/range, a C string, or a nullable handle to either.
// - absent handle => ArgumentNullError
// - empty sequence => ArgumentError("Argument was empty")
template <typename T>
T ArgumentNotNullOrEmpty(T&& arg_value, std::string_view arg_name = {}) {
  if constexpr (detail::kIsNullable<T>) {
    if (detail::IsNull(arg_value)) {
      throw ArgumentNullError(arg_name);
    }
    if (detail::IsEmptyReferent(arg_value)) {
      throw ArgumentError(std::string(kArgumentWasEmpty), arg_name);
    }
  } else {
    if (detail::IsEmptySequence(arg_value)) {
      throw ArgumentError(std::string(kArgumentWasEmpty), arg_name);
    }
  }

  return std::forward<T>(arg_value);
}

// Same check as ArgumentNotNullOrEmpty, but both failures raise ArgumentError
// carrying `message`.
template <typename T>
T ArgumentNotNullOrEmptyWithMessage(std::string_view message, T&& arg_value,
                                    std::string_view arg_name = {}) {
  bool missing = false;
  if constexpr (detail::kIsNullable<T>) {
    missing = detail::IsNull(arg_value) || detail::IsEmptyReferent(arg_value);
  } else {
    missing = detail::IsEmptySequence(arg_value);
  }

  if (missing) {
    throw ArgumentError(std::string(message), arg_name);
  }

  return std::forward<T>(arg_value);
}

// Throws ArgumentError(message) when `test` is false.
void ArgumentValid(std::string_view message, bool test, std::string_view arg_name = {});

// Ensures that a file name is present, non-empty, and names something on disk
// that is not a directory. Returns the file name unchanged.
const char* FileExists(const char* file_name, std::string_view arg_name = {});
std::string_view FileExists(std::string_view file_name, std::string_view arg_name = {});
std::string FileExists(std::string file_name, std::string_view arg_name = {});
std::filesystem::path FileExists(std::filesystem::path file_name, std::string_view arg_name = {});

// Null check for values of any type. Only nullable types can fail; plain value
// types always pass, whatever their value.
template <typename T>
T GenericArgumentNotNull(T&& arg_value, std::string_view arg_name = {}) {
  if constexpr (detail::kIsNullable<T>) {
    if (detail::IsNull(arg_value)) {
      throw ArgumentNullError(arg_name);
    }
  }

  return std::forward<T>(arg_value);
}

// Internal-invariant null check. Throws InvalidStateError(message).
template <typename T, std::enable_if_t<detail::kIsNullable<T>, int> = 0>
T NotNull(std::string_view message, T&& value) {
  if (detail::IsNull(value)) {
    throw InvalidStateError(std::string(message));
  }

  return std::forward<T>(value);
}

} // namespace argguard::guard

// Name-capturing forms: the literal argument expression becomes the
// parameter name reported by the failure.
#define ARGGUARD_ARGUMENT_ENUM_VALID(arg, ...) \
  ::argguard::guard::ArgumentEnumValid((arg), __VA_ARGS__, #arg)

#define ARGGUARD_ARGUMENT_NOT_NULL(arg) ::argguard::guard::ArgumentNotNull((arg), #arg)

#define ARGGUARD_ARGUMENT_NOT_NULL_OR_EMPTY(arg) \
  ::argguard::guard::ArgumentNotNullOrEmpty((arg), #arg)

#define ARGGUARD_FILE_EXISTS(arg) ::argguard::guard::FileExists((arg), #arg)

#define ARGGUARD_GENERIC_ARGUMENT_NOT_NULL(arg) \
  ::argguard::guard::GenericArgumentNotNull((arg), #arg)

#endif // ARGGUARD_GUARD_GUARD_HPP_
