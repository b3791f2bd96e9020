#pragma once

#include "core/config/ClientConfig.hpp"
#include "core/encoding/ContentEncoder.hpp"
#include "core/http/HttpTransport.hpp"
#include "core/service/MemobirdApi.hpp"
#include "core/session/SessionAuthenticator.hpp"
#include "core/types/PrintContent.hpp"
#include "core/types/PrintStatus.hpp"
#include <functional>
#include <memory>
#include <string>

namespace core::client {

    enum class SubmissionState {
        Unsubmitted,
        TokenResolved,
        Encoded,
        Posted,
        Accepted,
        RejectedRetry,
        RejectedFinal
    };

    std::string submissionStateToString(SubmissionState state);

    /**
     * @brief Printer service client: token handling, encoding, submission and status polling.
     *
     * Each call runs to completion on the calling thread. Calls may be issued concurrently,
     * the session token is shared and resolved at most once at a time.
     */
    class PrinterClient {
    public:
        static constexpr int MAX_SUBMIT_ATTEMPTS = 2;

        using StateCallback = std::function<void(SubmissionState state)>;

        PrinterClient(std::shared_ptr<http::HttpTransport> transport,
                      types::Credentials credentials,
                      const config::ServiceConfig &serviceConfig,
                      const config::EncoderConfig &encoderConfig);

        /**
         * @brief Submits a single piece of content.
         *
         * Text longer than the configured limit is sent as consecutive jobs, the receipt lists
         * every content id in order. A rejected token is refreshed and the job retried once.
         *
         * @throws AuthenticationException when binding fails or the token is rejected twice.
         */
        types::PrintReceipt submit(const types::PrintContent &content);

        /**
         * @brief Submits text and image parts as one job.
         */
        types::PrintReceipt submit(const types::PrintDocument &document);

        types::PrintStatus queryStatus(int contentId);

        /**
         * @brief Observer of submission state transitions. Set before issuing calls.
         */
        void setStateCallback(StateCallback callback) { stateCallback_ = std::move(callback); }

        session::SessionAuthenticator &session() { return *session_; }

    private:
        using Encode = std::function<types::EncodedPayload()>;
        using Post = std::function<int(const std::string &userId, const types::EncodedPayload &payload)>;

        std::shared_ptr<service::MemobirdApi> api_;
        std::shared_ptr<session::SessionAuthenticator> session_;
        encoding::ContentEncoder encoder_;
        config::EncoderConfig encoderConfig_;
        StateCallback stateCallback_;

        types::PrintReceipt submitText(const std::string &text);

        int runSubmission(const std::string &label, const Encode &encode, const Post &post);

        int postPaper(const std::string &userId, const std::string &printContent) const;

        void transition(SubmissionState &state, SubmissionState next, const std::string &label) const;
    };

} // namespace core::client
