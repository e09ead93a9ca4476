#ifndef PIPELINE_ERRORS_HPP
#define PIPELINE_ERRORS_HPP

#include <stdexcept>
#include <string>

// Device open/select failure. Fatal to capture, aborts startup.
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Device lost while the stream was running.
class StreamFault : public std::runtime_error {
public:
    explicit StreamFault(const std::string& what) : std::runtime_error(what) {}
};

// One burst could not be transcribed. The loop drops the burst and continues.
class TranscriptionFailure : public std::runtime_error {
public:
    explicit TranscriptionFailure(const std::string& what) : std::runtime_error(what) {}
};

class TranslationFailure : public std::runtime_error {
public:
    explicit TranslationFailure(const std::string& what) : std::runtime_error(what) {}
};

class RenderFailure : public std::runtime_error {
public:
    explicit RenderFailure(const std::string& what) : std::runtime_error(what) {}
};

// Invalid command line or missing input file.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

#endif // PIPELINE_ERRORS_HPP
