#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class TradeSimException : public std::runtime_error {
    public:
        explicit TradeSimException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradeSimException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    class DataLoadException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    // Missing columns or out-of-domain values in an input dataset
    class SchemaException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    // Trade log failed its post-run checks
    class IntegrityException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    class SimulationException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    class PersistenceException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    // --- Price lookup failures (recoverable per signal) ---
    class PriceResolutionException : public TradeSimException {
    public: using TradeSimException::TradeSimException; };

    class PriceNotFoundException : public PriceResolutionException {
    public: using PriceResolutionException::PriceResolutionException; };

    class InvalidPriceException : public PriceResolutionException {
    public: using PriceResolutionException::PriceResolutionException; };

    class NegativePriceException : public PriceResolutionException {
    public: using PriceResolutionException::PriceResolutionException; };

} // namespace core
