#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class CandleReplayException : public std::runtime_error {
    public:
        explicit CandleReplayException(const std::string& message)
            : std::runtime_error(message) {}

        explicit CandleReplayException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public CandleReplayException {
    public: using CandleReplayException::CandleReplayException; };

    class DataLoadException : public CandleReplayException {
    public: using CandleReplayException::CandleReplayException; };

    // Splitter input is unsorted or structurally empty
    class InvalidInputException : public CandleReplayException {
    public: using CandleReplayException::CandleReplayException; };

    // Splitter input repeats a symbol or an interval within a symbol
    class DuplicateDataException : public CandleReplayException {
    public: using CandleReplayException::CandleReplayException; };

    // Raised by CancellationToken and caught by the engine's run loop; never leaves it
    class OperationCancelledException : public CandleReplayException {
    public: using CandleReplayException::CandleReplayException; };

} // namespace core
