#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class ReplayException : public std::runtime_error {
    public:
        explicit ReplayException(const std::string& message)
            : std::runtime_error(message) {}

        explicit ReplayException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public ReplayException {
    public: using ReplayException::ReplayException; };

    class DataLoadException : public ReplayException {
    public: using ReplayException::ReplayException; };

    class IndicatorCalculationException : public ReplayException {
    public: using ReplayException::ReplayException; };

    class SessionException : public ReplayException {
    public: using ReplayException::ReplayException; };

} // namespace core
