#pragma once

#include <string>
#include <utility>

/**
 * @brief Why a binary structure could not be decoded
 */
enum class ParseError
{
    NONE,
    TRUNCATED,     // fewer bytes than the structure needs
    BAD_SIGNATURE, // magic bytes / sync word missing
    RESERVED_VALUE, // a field holds a reserved or forbidden value
    INCONSISTENT   // fields contradict each other or the enclosing structure
};

/**
 * @brief Outcome of parsing one binary structure
 *
 * Either success with a value, or a typed error with a readable message.
 */
template <typename T>
struct ParseResult
{
    bool success;
    T value;
    ParseError error;
    std::string error_message;

    ParseResult() : success(false), value(), error(ParseError::NONE) {}

    static ParseResult ok(T v)
    {
        ParseResult result;
        result.success = true;
        result.value = std::move(v);
        return result;
    }

    static ParseResult fail(ParseError e, const std::string &msg)
    {
        ParseResult result;
        result.error = e;
        result.error_message = msg;
        return result;
    }
};
