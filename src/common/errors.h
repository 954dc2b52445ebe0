#ifndef SALKAFKA_ERRORS_H_
#define SALKAFKA_ERRORS_H_

#include <stdexcept>
#include <string>

namespace SalKafka {

/**
 * Root of every error a benchmark run can raise. All of them are fatal for
 * the run; they propagate to main, which logs them and exits non-zero.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Unsupported field type, unknown strategy name, bad option combination.
/// Raised before any network I/O.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

/// A topic could not be created on the broker.
class ProvisioningError : public Error {
public:
    explicit ProvisioningError(const std::string& what) : Error(what) {}
};

/// A field failed custom or structured-record validation.
class ValidationError : public Error {
public:
    ValidationError(const std::string& field, const std::string& what)
        : Error("field " + field + ": " + what), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/// The broker (or its client) reported a failed publish.
class DeliveryError : public Error {
public:
    DeliveryError(const std::string& topic, const std::string& what)
        : Error("delivery to " + topic + " failed: " + what), topic_(topic) {}

    const std::string& topic() const { return topic_; }

private:
    std::string topic_;
};

/// A consumed message carried a broker error.
class MessageError : public Error {
public:
    MessageError(const std::string& topic, int code, const std::string& what)
        : Error("message error on " + topic + " (" + std::to_string(code) + "): " + what),
          topic_(topic), code_(code) {}

    const std::string& topic() const { return topic_; }
    int code() const { return code_; }

private:
    std::string topic_;
    int code_;
};

/// Schema registry transport or protocol failure.
class RegistryError : public Error {
public:
    explicit RegistryError(const std::string& what) : Error(what) {}
};

/// Payload that does not match its schema.
class CodecError : public Error {
public:
    explicit CodecError(const std::string& what) : Error(what) {}
};

} // namespace SalKafka

#endif // SALKAFKA_ERRORS_H_
