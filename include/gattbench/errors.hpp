#pragma once

#include "gattbench/records.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gattbench {

// Base of every failure the harness raises. kind() is the short tag written
// to the manifest error list.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
    virtual const char* kind() const { return "runtime"; }
};

// Invalid fault profile or trial parameter. Fatal to the requesting trial only.
class ConfigError : public Error {
public:
    using Error::Error;
    const char* kind() const override { return "config"; }
};

// Malformed or unknown command / packet. Logged, never fatal.
class ProtocolError : public Error {
public:
    using Error::Error;
    const char* kind() const override { return "protocol"; }
};

// Adapter already held by another orchestrator. Fatal to the whole sweep.
class LockContentionError : public Error {
public:
    LockContentionError(const std::string& message, std::string lock_path)
        : Error(message), lock_path_(std::move(lock_path)) {}
    const char* kind() const override { return "lock_contention"; }
    const std::string& lockPath() const { return lock_path_; }

private:
    std::string lock_path_;
};

// A control write (Reset / Start / Stop) was rejected by the transport
class CommandWriteError : public Error {
public:
    using Error::Error;
    const char* kind() const override { return "command"; }
};

// Operator abort observed at a suspension point
class CancelledError : public Error {
public:
    CancelledError() : Error("operation cancelled") {}
    const char* kind() const override { return "cancelled"; }
};

// Every connect attempt failed; carries the ordered attempt history
class ConnectionExhaustedError : public Error {
public:
    ConnectionExhaustedError(const std::string& message, std::vector<ConnectionAttempt> attempts)
        : Error(message), attempts_(std::move(attempts)) {}
    const char* kind() const override { return "connection_exhausted"; }
    const std::vector<ConnectionAttempt>& attempts() const { return attempts_; }

private:
    std::vector<ConnectionAttempt> attempts_;
};

} // namespace gattbench
