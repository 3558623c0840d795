#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace grocery {

/**
 * Base exception for all grocery errors.
 */
class GroceryError : public std::runtime_error {
public:
    explicit GroceryError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the caller supplied bad input.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }
};

/**
 * Thrown when an order fails validation.
 * Surfaces to the caller as reply code BAD_REQUEST; no task is created.
 */
class OrderRejectedError : public GroceryError {
public:
    explicit OrderRejectedError(const std::string& message)
        : GroceryError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when configuration or command-line input is malformed.
 */
class InvalidArgumentError : public GroceryError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : GroceryError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when a gRPC call fails.
 */
class GrpcError : public GroceryError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : GroceryError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_not_found() const override {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_connection_error() const override {
        return status_code_ == grpc::StatusCode::UNAVAILABLE ||
               status_code_ == grpc::StatusCode::DEADLINE_EXCEEDED;
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when a collaborator answers with a non-OK reply code.
 */
class CollaboratorError : public GroceryError {
public:
    explicit CollaboratorError(const std::string& message)
        : GroceryError(message) {}
};

/**
 * Thrown when a socket cannot be bound or connected.
 */
class ConnectionError : public GroceryError {
public:
    explicit ConnectionError(const std::string& message)
        : GroceryError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when a broadcast frame cannot be sent or received.
 */
class TransportError : public GroceryError {
public:
    explicit TransportError(const std::string& message)
        : GroceryError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when a broadcast payload cannot be parsed.
 */
class DecodeError : public GroceryError {
public:
    explicit DecodeError(const std::string& message)
        : GroceryError(message) {}

    bool is_invalid_argument() const override { return true; }
};

} // namespace grocery
