#include "core/session/SessionAuthenticator.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::session {

    SessionAuthenticator::SessionAuthenticator(std::shared_ptr<service::MemobirdApi> api,
                                               types::Credentials credentials)
            : api_(std::move(api)), credentials_(std::move(credentials)) {
        if (credentials_.deviceId.empty()) {
            throw std::invalid_argument("Memobird device ID cannot be empty");
        }
    }

    std::string SessionAuthenticator::resolveToken() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (token_) {
            return *token_;
        }

        if (pendingBinding_.valid()) {
            // Another caller is already binding: wait for its result instead of issuing a second request
            std::shared_future<std::string> pending = pendingBinding_;
            lock.unlock();
            return pending.get();
        }

        std::promise<std::string> promise;
        pendingBinding_ = promise.get_future().share();
        std::shared_future<std::string> pending = pendingBinding_;
        lock.unlock();

        try {
            std::string token = bindDevice();
            lock.lock();
            token_ = token;
            pendingBinding_ = {};
            lock.unlock();
            promise.set_value(token);
        } catch (const std::exception &) {
            lock.lock();
            pendingBinding_ = {};
            lock.unlock();
            promise.set_exception(std::current_exception());
        }
        return pending.get();
    }

    void SessionAuthenticator::invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token_) {
            Logger::logWarning("[SessionAuthenticator] User token invalidated");
        }
        token_.reset();
    }

    bool SessionAuthenticator::invalidate(const std::string &rejectedToken) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!token_ || *token_ != rejectedToken) {
            return false;
        }
        Logger::logWarning("[SessionAuthenticator] User token rejected by the service, invalidated");
        token_.reset();
        return true;
    }

    bool SessionAuthenticator::hasToken() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return token_.has_value();
    }

    std::string SessionAuthenticator::bindDevice() {
        ++bindingCount_;
        Logger::logInfo("[SessionAuthenticator] Binding device " + credentials_.deviceId + " (attempt #" +
                        std::to_string(bindingCount_.load()) + ")");
        try {
            return api_->bindUser(credentials_.deviceId, credentials_.userIdentifying);
        } catch (const types::PrinterServiceException &e) {
            Logger::logError("[SessionAuthenticator] Device binding refused: " + std::string(e.what()));
            throw types::AuthenticationException(types::AuthFailureReason::DeviceNotBound, e.what());
        } catch (const types::BridgeException &e) {
            Logger::logError("[SessionAuthenticator] Device binding failed: " + std::string(e.what()));
            throw types::AuthenticationException(types::AuthFailureReason::Transient, e.what());
        }
    }

} // namespace core::session
