#pragma once

#include <string>
#include <utility>

/**
 * @brief Failure categories for per-item and batch-level processing
 */
enum class ErrorKind
{
    NONE,
    DECODE_ERROR,     // Image or mask could not be decoded as a raster
    EMPTY_SEQUENCE,   // Frame group produced no usable frame
    IO_ERROR,         // Filesystem or encoder failure
    EMPTY_BATCH,      // Dataset contained no pairs
    MALFORMED_RECORD, // Record is missing fields or references an unsafe path
    TIMEOUT           // Item exceeded the configured processing time
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:
        return "None";
    case ErrorKind::DECODE_ERROR:
        return "DecodeError";
    case ErrorKind::EMPTY_SEQUENCE:
        return "EmptySequenceError";
    case ErrorKind::IO_ERROR:
        return "IOError";
    case ErrorKind::EMPTY_BATCH:
        return "EmptyBatchError";
    case ErrorKind::MALFORMED_RECORD:
        return "MalformedRecordError";
    case ErrorKind::TIMEOUT:
        return "TimeoutError";
    }
    return "UnknownError";
}

/**
 * @brief Outcome of a single processing step: either a value or an error kind with a message
 */
template <typename T>
struct Result
{
    bool success;
    ErrorKind error_kind;
    std::string error_message;
    T value;

    Result() : success(false), error_kind(ErrorKind::NONE), value() {}

    static Result ok(T v)
    {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static Result fail(ErrorKind kind, const std::string &message)
    {
        Result r;
        r.success = false;
        r.error_kind = kind;
        r.error_message = message;
        return r;
    }

    // Re-wrap another result's failure under this value type
    template <typename U>
    static Result failFrom(const Result<U> &other)
    {
        return fail(other.error_kind, other.error_message);
    }

    explicit operator bool() const { return success; }
};
