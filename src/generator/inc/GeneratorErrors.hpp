#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>


// Malformed or incomplete tabular input
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message,
                         std::string field = {},
                         std::optional<size_t> ordinal = std::nullopt)
        : std::runtime_error(message), field_(std::move(field)), ordinal_(ordinal) {}

    // Offending column name, empty when the error is not tied to one
    const std::string& field() const noexcept { return field_; }

    // 1-based data row, if the error is tied to one
    std::optional<size_t> ordinal() const noexcept { return ordinal_; }

private:
    std::string field_;
    std::optional<size_t> ordinal_;
};


class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& message = "No rows to process")
        : std::runtime_error(message) {}
};
