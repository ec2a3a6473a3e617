#pragma once
#include <stdexcept>
#include <string>

// Input arrays of different lengths.
class InputShapeError : public std::invalid_argument {
public:
    explicit InputShapeError(const std::string& what) : std::invalid_argument(what) {}
};

// Tracker parameter out of its valid range.
class ParameterError : public std::invalid_argument {
public:
    explicit ParameterError(const std::string& what) : std::invalid_argument(what) {}
};

// A snapshot could not be rendered, shown or saved. Never fatal to tracking.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& what) : std::runtime_error(what) {}
};
