#pragma once

#include <stdexcept>
#include <string>

class PkgtreeException : public std::runtime_error {
public:
    explicit PkgtreeException(const std::string& message)
        : std::runtime_error(message) {}
};
