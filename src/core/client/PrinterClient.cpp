#include "core/client/PrinterClient.hpp"
#include "core/client/TextChunker.hpp"
#include "core/encoding/TextCodec.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <optional>
#include <variant>

namespace core::client {

    std::string submissionStateToString(SubmissionState state) {
        switch (state) {
            case SubmissionState::Unsubmitted:
                return "UNSUBMITTED";
            case SubmissionState::TokenResolved:
                return "TOKEN_RESOLVED";
            case SubmissionState::Encoded:
                return "ENCODED";
            case SubmissionState::Posted:
                return "POSTED";
            case SubmissionState::Accepted:
                return "ACCEPTED";
            case SubmissionState::RejectedRetry:
                return "REJECTED_RETRY";
            case SubmissionState::RejectedFinal:
                return "REJECTED_FINAL";
            default:
                return "UNKNOWN";
        }
    }

    PrinterClient::PrinterClient(std::shared_ptr<http::HttpTransport> transport,
                                 types::Credentials credentials,
                                 const config::ServiceConfig &serviceConfig,
                                 const config::EncoderConfig &encoderConfig)
            : api_(std::make_shared<service::MemobirdApi>(transport, serviceConfig, credentials.apiKey)),
              session_(std::make_shared<session::SessionAuthenticator>(api_, credentials)),
              encoder_(transport, encoderConfig),
              encoderConfig_(encoderConfig) {
        if (encoderConfig_.maxTextLength == 0) {
            throw std::invalid_argument("maxTextLength must be positive");
        }
    }

    types::PrintReceipt PrinterClient::submit(const types::PrintContent &content) {
        if (const auto *text = std::get_if<types::TextContent>(&content)) {
            return submitText(text->body);
        }

        types::PrintReceipt receipt;
        if (std::holds_alternative<types::UrlContent>(content)) {
            receipt.contentId = runSubmission(
                    "web page",
                    [&] { return encoder_.encode(content); },
                    [this](const std::string &userId, const types::EncodedPayload &payload) {
                        return api_->printUrl(session_->credentials().deviceId, userId, payload.data);
                    });
        } else {
            receipt.contentId = runSubmission(
                    "image",
                    [&] { return encoder_.encode(content); },
                    [this](const std::string &userId, const types::EncodedPayload &payload) {
                        return postPaper(userId, encoding::ContentEncoder::toWirePart(payload));
                    });
        }
        receipt.contentIds.push_back(receipt.contentId);
        return receipt;
    }

    types::PrintReceipt PrinterClient::submit(const types::PrintDocument &document) {
        for (const auto &part: document) {
            const auto *text = std::get_if<types::TextContent>(&part);
            if (text && encoding::TextCodec::codePointCount(text->body) > encoderConfig_.maxTextLength) {
                throw types::InvalidContentException("document text part exceeds " +
                                                     std::to_string(encoderConfig_.maxTextLength) + " characters");
            }
        }

        types::PrintReceipt receipt;
        receipt.contentId = runSubmission(
                "document (" + std::to_string(document.size()) + " parts)",
                [&] {
                    return types::EncodedPayload{types::ContentKind::Text, encoder_.encodeDocument(document)};
                },
                [this](const std::string &userId, const types::EncodedPayload &payload) {
                    // Already joined wire parts
                    return postPaper(userId, payload.data);
                });
        receipt.contentIds.push_back(receipt.contentId);
        return receipt;
    }

    types::PrintStatus PrinterClient::queryStatus(int contentId) {
        std::optional<int> flag = api_->getPrintFlag(contentId);
        types::PrintStatus status = types::printStatusFromFlag(flag);
        if (status == types::PrintStatus::Unknown) {
            Logger::logWarning("[PrinterClient] Unrecognized print flag for content " + std::to_string(contentId) +
                               ": " + (flag ? std::to_string(*flag) : std::string("<missing>")));
        }
        return status;
    }

    types::PrintReceipt PrinterClient::submitText(const std::string &text) {
        std::vector<std::string> chunks;
        if (encoding::TextCodec::codePointCount(text) > encoderConfig_.maxTextLength) {
            chunks = splitText(text, encoderConfig_.maxTextLength);
            Logger::logInfo("[PrinterClient] Text split into " + std::to_string(chunks.size()) + " jobs");
        } else {
            chunks.push_back(text);
        }

        types::PrintReceipt receipt;
        for (size_t index = 0; index < chunks.size(); ++index) {
            const std::string &chunk = chunks[index];
            std::string label = chunks.size() == 1
                                ? std::string("text")
                                : "text " + std::to_string(index + 1) + "/" + std::to_string(chunks.size());
            int contentId = runSubmission(
                    label,
                    [&] { return encoder_.encode(types::TextContent{chunk}); },
                    [this](const std::string &userId, const types::EncodedPayload &payload) {
                        return postPaper(userId, encoding::ContentEncoder::toWirePart(payload));
                    });
            receipt.contentIds.push_back(contentId);
            receipt.contentId = contentId;
        }
        return receipt;
    }

    int PrinterClient::runSubmission(const std::string &label, const Encode &encode, const Post &post) {
        SubmissionState state = SubmissionState::Unsubmitted;
        std::optional<types::EncodedPayload> payload;

        for (int attempt = 1; attempt <= MAX_SUBMIT_ATTEMPTS; ++attempt) {
            std::string userId = session_->resolveToken();
            transition(state, SubmissionState::TokenResolved, label);

            // Encoding does not depend on the token, a retry reuses the first result
            if (!payload) {
                payload = encode();
            }
            transition(state, SubmissionState::Encoded, label);

            transition(state, SubmissionState::Posted, label);
            try {
                int contentId = post(userId, *payload);
                transition(state, SubmissionState::Accepted, label);
                return contentId;
            } catch (const types::TokenRejectedException &e) {
                session_->invalidate(userId);
                if (attempt < MAX_SUBMIT_ATTEMPTS) {
                    transition(state, SubmissionState::RejectedRetry, label);
                    continue;
                }
                transition(state, SubmissionState::RejectedFinal, label);
                throw types::AuthenticationException(types::AuthFailureReason::TokenRejected, e.what());
            }
        }
        throw std::logic_error("submission loop exited without a result");
    }

    int PrinterClient::postPaper(const std::string &userId, const std::string &printContent) const {
        return api_->printPaper(session_->credentials().deviceId, userId, printContent);
    }

    void PrinterClient::transition(SubmissionState &state, SubmissionState next, const std::string &label) const {
        Logger::logInfo("[PrinterClient] " + label + ": " + submissionStateToString(state) + " -> " +
                        submissionStateToString(next));
        state = next;
        if (stateCallback_) {
            stateCallback_(next);
        }
    }

} // namespace core::client
