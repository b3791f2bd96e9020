#pragma once
#include <stdexcept>
#include <string>

namespace core::types {

class BridgeException : public std::runtime_error {
public:
    explicit BridgeException(const std::string& msg)
        : std::runtime_error(msg) {}
};

// ---- Transport ----

class ConnectivityException : public BridgeException {
public:
    explicit ConnectivityException(const std::string& msg)
        : BridgeException("Connectivity error: " + msg) {}
};

class TimeoutException : public BridgeException {
public:
    explicit TimeoutException(const std::string& url)
        : BridgeException("Timeout waiting for response from " + url) {}
};

class HttpStatusException : public BridgeException {
public:
    HttpStatusException(long statusCode, const std::string& url, const std::string& bodySnippet = "")
        : BridgeException("HTTP error " + std::to_string(statusCode) + " from " + url +
                          (bodySnippet.empty() ? "" : ". Response: " + bodySnippet)),
          statusCode_(statusCode) {}

    long statusCode() const { return statusCode_; }

private:
    long statusCode_;
};

// ---- Encoding ----

class InvalidImageException : public BridgeException {
public:
    explicit InvalidImageException(const std::string& msg)
        : BridgeException("Invalid image: " + msg) {}
};

class InvalidContentException : public BridgeException {
public:
    explicit InvalidContentException(const std::string& msg)
        : BridgeException("Invalid content: " + msg) {}
};

// ---- Session ----

enum class AuthFailureReason {
    DeviceNotBound,
    Transient,
    TokenRejected
};

inline std::string authFailureReasonToString(AuthFailureReason reason) {
    switch (reason) {
        case AuthFailureReason::DeviceNotBound:
            return "device not bound";
        case AuthFailureReason::Transient:
            return "transient failure";
        case AuthFailureReason::TokenRejected:
            return "token rejected";
        default:
            return "unknown";
    }
}

class AuthenticationException : public BridgeException {
public:
    AuthenticationException(AuthFailureReason reason, const std::string& msg)
        : BridgeException("Authentication failed (" + authFailureReasonToString(reason) + "): " + msg),
          reason_(reason) {}

    AuthFailureReason reason() const { return reason_; }

    bool isRetryable() const { return reason_ == AuthFailureReason::Transient; }

private:
    AuthFailureReason reason_;
};

// ---- Printer service ----

class PrinterServiceException : public BridgeException {
public:
    PrinterServiceException(int code, const std::string& message)
        : BridgeException("Printer service error (code " + std::to_string(code) + "): " + message),
          code_(code), serviceMessage_(message) {}

    int code() const { return code_; }

    const std::string& serviceMessage() const { return serviceMessage_; }

private:
    int code_;
    std::string serviceMessage_;
};

/**
 * @brief Raised when the service refuses a request because the user token is no longer valid.
 */
class TokenRejectedException : public PrinterServiceException {
public:
    TokenRejectedException(int code, const std::string& message)
        : PrinterServiceException(code, message) {}
};

}
