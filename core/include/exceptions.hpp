#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class IndicatorEngineException : public std::runtime_error {
    public:
        explicit IndicatorEngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit IndicatorEngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Engine errors
    class InvalidPeriodException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    class InvalidMultiplierException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    class NonFiniteInputException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    class OutOfOrderObservationException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    // Raised when a reference (TA-Lib) computation fails
    class IndicatorCalculationException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    // Shell errors
    class ConfigException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    class DataLoadException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    class ApiRequestException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

    class DatabaseException : public IndicatorEngineException {
    public: using IndicatorEngineException::IndicatorEngineException; };

} // namespace core
