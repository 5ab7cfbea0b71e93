#pragma once

#include <stdexcept>

namespace sandpool {

// Invalid daemon or sandbox configuration, the daemon refuses to start
class ConfigError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// An isolation layer could not be applied to a worker
class SetupFailure : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

// Malformed message or misuse of an arena slot by a peer
class ProtocolError : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

} // namespace sandpool
