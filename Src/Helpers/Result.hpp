#pragma once
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

enum class ErrorKind
{
    NONE,
    UNKNOWN_SYMBOL,                 // symbol has no forward code
    MISALIGNED_PAYLOAD,             // bit length not a multiple of 8 before packing
    TRUNCATED_OR_CORRUPT_PAYLOAD,   // bits left unmatched, bad padding header
    INVALID_CONTAINER,              // frequency table header malformed
    INVALID_ARGUMENT,
    IO_FAILURE
};

inline std::string errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::NONE: return "None";
        case ErrorKind::UNKNOWN_SYMBOL: return "UnknownSymbol";
        case ErrorKind::MISALIGNED_PAYLOAD: return "MisalignedPayload";
        case ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD: return "TruncatedOrCorruptPayload";
        case ErrorKind::INVALID_CONTAINER: return "InvalidContainer";
        case ErrorKind::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorKind::IO_FAILURE: return "IoFailure";
    }
    return "Unknown";
}

template<typename T>
struct Result
{
    std::optional<T> value;
    std::optional<std::string> error;
    ErrorKind errorKind = ErrorKind::NONE;
    std::vector<std::string> warnings;

    bool success() const
    {
        return value.has_value() && !error.has_value();
    }

    bool hasError() const
    {
        return error.has_value();
    }

    bool hasWarning() const
    {
        return !warnings.empty();
    }

    void setValue(const T& val)
    {
        value = val;
    }

    void setValue(T&& val)
    {
        value = std::move(val);
    }

    void setError(ErrorKind kind, const std::string& errorMessage)
    {
        value.reset();
        errorKind = kind;
        error = errorMessage;
    }

    void addWarning(const std::string& warningMessage)
    {
        warnings.push_back(warningMessage);
    }

    std::string getError() const
    {
        return error.value_or("No error");
    }

    ErrorKind getErrorKind() const
    {
        return errorKind;
    }

    // "[Kind] message", used when reporting to the user
    std::string describeError() const
    {
        return "[" + errorKindToString(errorKind) + "] " + getError();
    }

    T getValue() const
    {
        if (value.has_value()) {
            return value.value();
        }
        else {
            throw std::runtime_error("No value set in Result: " + getError());
        }
    }

    std::vector<std::string> getWarnings() const
    {
        return warnings;
    }
};


template<typename T>
static Result<T> makeError(ErrorKind kind, const std::string& errorMessage)
{
    Result<T> result;
    result.setError(kind, errorMessage);
    return result;
};

template<typename T>
static Result<T> makeResult(T value, Result<T>* result = nullptr)
{
    if (result != nullptr) {
        result->setValue(std::move(value));
        return *result;
    }
    Result<T> newResult;
    newResult.setValue(std::move(value));
    return newResult;
};

// Carries the error and warnings of `source` over to a result of another type.
template<typename T, typename U>
static Result<T> forwardError(const Result<U>& source)
{
    Result<T> result;
    result.setError(source.getErrorKind(), source.getError());
    result.warnings = source.warnings;
    return result;
};
