#pragma once
#ifndef TESTSIEVE_ERRORS_H
#define TESTSIEVE_ERRORS_H

#include <stdexcept>
#include <string>

namespace testsieve {

// Base class for every failure raised by a fingerprint store.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// Transient transport failure (timeout, reset, 5xx-style server status)
// that survived all retries.
class StoreNetworkError : public StoreError {
public:
    explicit StoreNetworkError(const std::string& msg) : StoreError(msg) {}
};

// The network store refused a request (bad token, unknown job or op).
// Not retried.
class StoreRejectedError : public StoreError {
public:
    explicit StoreRejectedError(const std::string& msg) : StoreError(msg) {}
};

// No store could be opened at all.
class StoreConfigError : public StoreError {
public:
    explicit StoreConfigError(const std::string& msg) : StoreError(msg) {}
};

// Malformed frame or payload on the wire.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

// The coverage stack was changed by a test and no longer matches what the
// recorder started with.
class RecorderError : public std::runtime_error {
public:
    explicit RecorderError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace testsieve

#endif  // TESTSIEVE_ERRORS_H
