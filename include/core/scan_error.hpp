#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief The scan root cannot be used; the whole scan is aborted
 */
class ScanError : public std::runtime_error
{
public:
    explicit ScanError(const std::string &message) : std::runtime_error(message) {}
};
