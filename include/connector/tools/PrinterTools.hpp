#pragma once

#include "connector/registry/ToolRegistry.hpp"
#include "core/client/PrinterClient.hpp"
#include <memory>

namespace connector::tools {

    /**
     * @brief Printer tools exposed to the tool-call protocol.
     *
     * Argument errors propagate as std::invalid_argument. Every printer error is turned into
     * an error result so a failing job never takes the server down.
     */
    class PrinterTools {
    public:
        explicit PrinterTools(std::shared_ptr<core::client::PrinterClient> client);

        void registerWith(ToolRegistry &registry);

        ToolResult printText(const nlohmann::json &arguments);

        ToolResult printImageFromUrl(const nlohmann::json &arguments);

        ToolResult printImage(const nlohmann::json &arguments);

        ToolResult printUrl(const nlohmann::json &arguments);

        ToolResult checkPrintStatus(const nlohmann::json &arguments);

        /**
         * @brief Name reported to the caller for an error raised by the printer client.
         */
        static std::string errorKind(const std::exception &error);

    private:
        std::shared_ptr<core::client::PrinterClient> client_;

        ToolResult guarded(const std::string &tool, const std::function<ToolResult()> &action) const;
    };

}
