#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace kuf {

struct Error {
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}

    /// Prefix the message with the stage that failed ("battlefield 'x': ...").
    Error with_context(const std::string& context) const {
        return Error(context + ": " + message);
    }
};

/// Holds either a value of type T or an Error.
/// Loaders at the Lua boundary return this; the tick loop never does.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(data_) : std::move(fallback);
    }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

} // namespace kuf
