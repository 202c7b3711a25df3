#pragma once

#include <variant>
#include <utility>

namespace vgauge {

enum class Error
{
    TIMEOUT,
    CHECKSUM_MISMATCH,
    INVALID_RESPONSE,
    PORT_ERROR,
    CMD_FAILURE,
    READ_ERROR,
    WRITE_ERROR,
    PARSE_ERROR,
    INVALID_VALUE
};

const char* error_name(Error error);

enum class Dialect
{
    PROTOCOL_A,
    PROTOCOL_B
};

template<typename T>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    T value_or(T fallback) const
    {
        if (const T* v = std::get_if<T>(&data_)) {
            return *v;
        }
        return fallback;
    }

    Error error() const
    {
        return std::get<Error>(data_);
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error)
    {
        return Result(error);
    }

private:
    std::variant<T, Error> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(error) {}
};

} // namespace vgauge
