// result.hpp
#pragma once
#include <string>
#include <utility>

// Outcome of a fallible operation: either data, or a message saying why not.
template<typename T>
struct Result {
    bool success;
    std::string message;
    T data;

    static Result<T> Ok(T data) {
        return {true, "", std::move(data)};
    }

    static Result<T> Error(const std::string& msg) {
        return {false, msg, T{}};
    }

    bool ok() const { return success; }
};

// Specialization for operations that only report success or failure
template<>
struct Result<void> {
    bool success;
    std::string message;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Error(const std::string& msg) {
        return {false, msg};
    }

    bool ok() const { return success; }
};
