#pragma once

#include "core/service/MemobirdApi.hpp"
#include "core/types/PrintContent.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace core::session {

    /**
     * @brief Owns the user token bound to the configured device.
     *
     * The token is resolved lazily and reused until invalidated. Concurrent callers that find
     * no token share a single binding request and all observe its outcome, value or error.
     */
    class SessionAuthenticator {
    public:
        SessionAuthenticator(std::shared_ptr<service::MemobirdApi> api, types::Credentials credentials);

        /**
         * @throws AuthenticationException (DeviceNotBound or Transient) when binding fails.
         */
        std::string resolveToken();

        /**
         * @brief Drops the cached token unconditionally.
         */
        void invalidate();

        /**
         * @brief Drops the cached token only if it is still @p rejectedToken.
         * @return true if the cache was cleared.
         */
        bool invalidate(const std::string &rejectedToken);

        bool hasToken() const;

        size_t bindingCount() const { return bindingCount_; }

        const types::Credentials &credentials() const { return credentials_; }

    private:
        std::shared_ptr<service::MemobirdApi> api_;
        types::Credentials credentials_;

        mutable std::mutex mutex_;
        std::optional<std::string> token_;
        std::shared_future<std::string> pendingBinding_;
        std::atomic<size_t> bindingCount_{0};

        std::string bindDevice();
    };

} // namespace core::session
