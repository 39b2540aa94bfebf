#pragma once

#include <boost/beast/http/status.hpp>
#include <stdexcept>
#include <string>

namespace edgegate::core {

class EnrollmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Forwarded certificate could not be decoded. Never reaches the client.
class ParseError : public EnrollmentError {
public:
    using EnrollmentError::EnrollmentError;
};

// Trust evidence was judged and rejected.
class AuthError : public EnrollmentError {
public:
    explicit AuthError(const std::string& message,
                       boost::beast::http::status status = boost::beast::http::status::unauthorized)
        : EnrollmentError(message)
        , status_(status) {}

    boost::beast::http::status status() const { return status_; }

private:
    boost::beast::http::status status_;
};

// Certificate issuance failed after authentication succeeded.
class SignError : public EnrollmentError {
public:
    using EnrollmentError::EnrollmentError;
};

} // namespace edgegate::core
