#include "connector/tools/PrinterTools.hpp"
#include "connector/models/print/PrintImageFromUrlRequest.hpp"
#include "connector/models/print/PrintImageRequest.hpp"
#include "connector/models/print/PrintJobResponse.hpp"
#include "connector/models/print/PrintTextRequest.hpp"
#include "connector/models/print/PrintUrlRequest.hpp"
#include "connector/models/status/PrintStatusRequest.hpp"
#include "connector/models/status/PrintStatusResponse.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Base64.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"

namespace connector::tools {
    namespace {
        nlohmann::json stringSchema(const std::string &property, const std::string &description) {
            return {
                    {"type",       "object"},
                    {"properties", {{property, {{"type", "string"}, {"description", description}}}}},
                    {"required",   nlohmann::json::array({property})}
            };
        }

        nlohmann::json receiptToJson(const core::types::PrintReceipt &receipt) {
            models::print::PrintJobResponse response;
            response.contentId = receipt.contentId;
            response.contentIds = receipt.contentIds;
            return response.toJson();
        }
    }

    PrinterTools::PrinterTools(std::shared_ptr<core::client::PrinterClient> client)
            : client_(std::move(client)) {
        if (!client_) {
            throw std::invalid_argument("PrinterTools requires a printer client");
        }
    }

    void PrinterTools::registerWith(ToolRegistry &registry) {
        registry.registerTool({
                "print_text",
                "Print text on the Memobird printer. Long text is split into several jobs.",
                stringSchema("text", "Text to print (UTF-8)"),
                [this](const nlohmann::json &arguments) { return printText(arguments); }
        });
        registry.registerTool({
                "print_image_from_url",
                "Download an image (PNG or JPEG) and print it on the Memobird printer.",
                stringSchema("url", "HTTP(S) URL of the image"),
                [this](const nlohmann::json &arguments) { return printImageFromUrl(arguments); }
        });
        registry.registerTool({
                "print_image",
                "Print a base64 encoded image (PNG or JPEG) on the Memobird printer.",
                stringSchema("imageBase64", "Raw base64 image data or a data:image/...;base64, URL"),
                [this](const nlohmann::json &arguments) { return printImage(arguments); }
        });
        registry.registerTool({
                "print_url",
                "Print a web page, rendered by the Memobird service.",
                stringSchema("url", "Address of the web page"),
                [this](const nlohmann::json &arguments) { return printUrl(arguments); }
        });
        registry.registerTool({
                "check_print_status",
                "Check whether a submitted job has been printed.",
                {
                        {"type",       "object"},
                        {"properties", {{"contentId", {{"type", "integer"},
                                                       {"description", "Content ID returned by a print tool"}}}}},
                        {"required",   nlohmann::json::array({"contentId"})}
                },
                [this](const nlohmann::json &arguments) { return checkPrintStatus(arguments); }
        });
    }

    ToolResult PrinterTools::printText(const nlohmann::json &arguments) {
        models::print::PrintTextRequest request(arguments);
        Logger::logInfo("[PrinterTools] print_text: '" + core::utils::truncateForLog(request.text, 50) + "'");

        return guarded("print_text", [&] {
            core::types::PrintReceipt receipt = client_->submit(core::types::PrintContent{
                    core::types::TextContent{request.text}});
            return ToolResult::success(receiptToJson(receipt));
        });
    }

    ToolResult PrinterTools::printImageFromUrl(const nlohmann::json &arguments) {
        models::print::PrintImageFromUrlRequest request(arguments);
        Logger::logInfo("[PrinterTools] print_image_from_url: " + core::utils::redactUrl(request.url));

        return guarded("print_image_from_url", [&] {
            core::types::PrintReceipt receipt = client_->submit(core::types::PrintContent{
                    core::types::RemoteImageContent{request.url}});
            return ToolResult::success(receiptToJson(receipt));
        });
    }

    ToolResult PrinterTools::printImage(const nlohmann::json &arguments) {
        models::print::PrintImageRequest request(arguments);
        Logger::logInfo("[PrinterTools] print_image: " + std::to_string(request.imageBase64.size()) +
                        " base64 characters" + (request.isDataUrl() ? " (data URL)" : ""));

        return guarded("print_image", [&] {
            std::string payload = request.payload();
            std::optional<std::vector<uint8_t>> bytes = core::utils::base64Decode(payload);
            if (payload.empty() || !bytes || bytes->empty()) {
                throw core::types::InvalidImageException("imageBase64 is not valid base64 image data");
            }

            core::types::ImageContent image;
            image.bytes = std::move(*bytes);
            core::types::PrintReceipt receipt = client_->submit(core::types::PrintContent{std::move(image)});
            return ToolResult::success(receiptToJson(receipt));
        });
    }

    ToolResult PrinterTools::printUrl(const nlohmann::json &arguments) {
        models::print::PrintUrlRequest request(arguments);
        Logger::logInfo("[PrinterTools] print_url: " + core::utils::redactUrl(request.url));

        return guarded("print_url", [&] {
            core::types::PrintReceipt receipt = client_->submit(core::types::PrintContent{
                    core::types::UrlContent{request.url}});
            return ToolResult::success(receiptToJson(receipt));
        });
    }

    ToolResult PrinterTools::checkPrintStatus(const nlohmann::json &arguments) {
        models::status::PrintStatusRequest request(arguments);
        if (!request.isValid()) {
            throw std::invalid_argument("Argument 'contentId' must be a positive print content ID");
        }
        Logger::logInfo("[PrinterTools] check_print_status: " + std::to_string(request.contentId));

        return guarded("check_print_status", [&] {
            models::status::PrintStatusResponse response;
            response.contentId = request.contentId;
            response.status = core::types::printStatusToString(client_->queryStatus(request.contentId));
            return ToolResult::success(response.toJson());
        });
    }

    std::string PrinterTools::errorKind(const std::exception &error) {
        using namespace core::types;
        if (dynamic_cast<const AuthenticationException *>(&error)) return "AuthenticationError";
        if (dynamic_cast<const PrinterServiceException *>(&error)) return "PrinterServiceError";
        if (dynamic_cast<const TimeoutException *>(&error)) return "TimeoutError";
        if (dynamic_cast<const ConnectivityException *>(&error)) return "ConnectivityError";
        if (dynamic_cast<const HttpStatusException *>(&error)) return "HttpStatusError";
        if (dynamic_cast<const InvalidImageException *>(&error)) return "InvalidImageError";
        if (dynamic_cast<const InvalidContentException *>(&error)) return "InvalidContentError";
        return "InternalError";
    }

    ToolResult PrinterTools::guarded(const std::string &tool, const std::function<ToolResult()> &action) const {
        try {
            return action();
        } catch (const core::types::BridgeException &e) {
            Logger::logError("[PrinterTools] " + tool + " failed: " + std::string(e.what()));
            return ToolResult::failure(errorKind(e), e.what());
        }
    }

}
