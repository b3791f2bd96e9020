#pragma once

#include <optional>
#include <string>

namespace core::types {

    enum class PrintStatus {
        Pending,
        Printed,
        Failed,
        Unknown
    };

    /**
     * @brief Maps the service "printflag" to a status. Missing or unmapped flags are Unknown.
     */
    inline PrintStatus printStatusFromFlag(const std::optional<int> &flag) {
        if (!flag) {
            return PrintStatus::Unknown;
        }
        switch (*flag) {
            case 0:
                return PrintStatus::Pending;
            case 1:
                return PrintStatus::Printed;
            case 2:
                return PrintStatus::Failed;
            default:
                return PrintStatus::Unknown;
        }
    }

    inline std::string printStatusToString(PrintStatus status) {
        switch (status) {
            case PrintStatus::Pending:
                return "PENDING";
            case PrintStatus::Printed:
                return "PRINTED";
            case PrintStatus::Failed:
                return "FAILED";
            default:
                return "UNKNOWN";
        }
    }

}
