// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions raised by json_ivm operations.
///
/// Only hard failures are exceptions. Lookup failures (missing field,
/// wrong container kind, no matching element, unresolved path) are not
/// errors: operations return their input unchanged, false, or nullopt.

#pragma once

#include <json_ivm/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace json_ivm {

/// Base class for every json_ivm exception.
class JSON_IVM_CLASS Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// An operation that requires a specific JSON kind received another one.
class JSON_IVM_CLASS TypeMismatchError : public Error {
public:
    TypeMismatchError(std::string argument, std::string expected, std::string actual)
        : Error(argument + " must be a JSON " + expected + ", got: " + actual)
        , argument_(std::move(argument))
        , expected_(std::move(expected))
        , actual_(std::move(actual)) {}

    [[nodiscard]] const std::string& argument() const noexcept { return argument_; }
    [[nodiscard]] const std::string& expected() const noexcept { return expected_; }
    [[nodiscard]] const std::string& actual() const noexcept { return actual_; }

private:
    std::string argument_;
    std::string expected_;
    std::string actual_;
};

/// A document is nested deeper than the configured limit.
class JSON_IVM_CLASS MaxDepthExceededError : public Error {
public:
    explicit MaxDepthExceededError(std::size_t limit)
        : Error("JSON nesting too deep (max " + std::to_string(limit) +
                ", found >" + std::to_string(limit) + ")")
        , limit_(limit) {}

    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t limit_;
};

/// A textual path ("a.b[0].c") could not be parsed.
class JSON_IVM_CLASS PathSyntaxError : public Error {
public:
    PathSyntaxError(std::string path, const std::string& reason)
        : Error("Invalid path '" + path + "': " + reason)
        , path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// A scalar argument (sort order, batch spec container) is malformed.
class JSON_IVM_CLASS InvalidArgumentError : public Error {
public:
    using Error::Error;
};

} // namespace json_ivm
