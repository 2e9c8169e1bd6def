#pragma once
#include <stdexcept>
#include <string>

namespace prisma {

// REST failures raised by ApiClient. Workers convert them into session
// events; only the login loop catches AuthError directly.
class ApiError : public std::runtime_error {
public:
    explicit ApiError(const std::string& what) : std::runtime_error(what) {}
};

// Bad credentials or a login response without a token.
class AuthError : public ApiError {
public:
    using ApiError::ApiError;
};

// Topology or history fetch failure.
class LoadError : public ApiError {
public:
    using ApiError::ApiError;
};

// Message submission failure.
class SendError : public ApiError {
public:
    using ApiError::ApiError;
};

} // namespace prisma
