#pragma once

#include <string>
#include <utility>
#include <variant>

namespace tradesim {

struct Error {
  std::string message;
  std::string path;   // where in the input the problem was found, e.g. "asks[3][0]"

  std::string describe() const {
    return path.empty() ? message : path + ": " + message;
  }
};

// Either a decoded value or the reason decoding failed. Callers test it like
// a pointer: `if (!r) log(r.error().describe());`
template <typename T>
class Result {
public:
  Result(const T& value) : v_(value) {}
  Result(T&& value) : v_(std::move(value)) {}
  Result(const Error& error) : v_(error) {}
  Result(Error&& error) : v_(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(v_); }
  const T& value() const { return std::get<T>(v_); }

  const Error& error() const { return std::get<Error>(v_); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, Error> v_;
};

} // namespace tradesim
