#ifndef TOOLGATE_CORE_RESULT_H
#define TOOLGATE_CORE_RESULT_H

#include <string>
#include <type_traits>
#include <utility>

#include "toolgate/core/compat.h"
#include "toolgate/core/error.h"

namespace toolgate {

template <typename T>
using Result = variant<T, Error>;

// For cleaner API, operations without a value return VoidResult
using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
  return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isSuccess(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& getError(const Result<T>& result) {
  return get<Error>(result);
}

}  // namespace toolgate

#endif  // TOOLGATE_CORE_RESULT_H
