// Result.hpp
#pragma once
#include <string>
#include <utility>

enum class ErrorType { None, IOError, DirectoryError, ParseError, ResourceError, UsageError };

inline const char* errorTypeName(ErrorType type) {
    switch (type) {
    case ErrorType::None: return "None";
    case ErrorType::IOError: return "IOError";
    case ErrorType::DirectoryError: return "DirectoryError";
    case ErrorType::ParseError: return "ParseError";
    case ErrorType::ResourceError: return "ResourceError";
    case ErrorType::UsageError: return "UsageError";
    }
    return "Unknown";
}

template<typename T>
struct Result {
    bool success;
    ErrorType error;
    std::string message;
    T data;

    static Result<T> Ok(T data) {
        return {true, ErrorType::None, "", std::move(data)};
    }

    static Result<T> Error(ErrorType type, const std::string& msg) {
        return {false, type, msg, T{}};
    }

    // re-wrap another result's failure without its payload
    template<typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, other.error, other.message, T{}};
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    ErrorType error;
    std::string message;

    static Result<void> Ok() {
        return {true, ErrorType::None, ""};
    }

    static Result<void> Error(ErrorType type, const std::string& msg) {
        return {false, type, msg};
    }

    template<typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.error, other.message};
    }
};
