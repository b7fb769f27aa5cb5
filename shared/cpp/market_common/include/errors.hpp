#pragma once
#include <stdexcept>
#include <string>

// Failures raised by the stores and services. The HTTP layer maps each one to a
// status code; anything else is reported as an internal error.

class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConflictError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Datastore or cache unavailable.
class InfrastructureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
