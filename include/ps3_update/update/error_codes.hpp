#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ps3_update {
namespace update {

enum class UpdateErrorCode {
    NETWORK_ERROR = 100,
    
    XML_PARSE_ERROR = 200,
    
    INVALID_IDENTIFIER = 300,
    NO_UPDATES_FOUND = 301,
    
    FILESYSTEM_ERROR = 400,
    
    DOWNLOAD_ERROR = 500,
    TRANSFER_CANCELLED = 501,
    
    JOB_NOT_FOUND = 600
};

using UpdateErrorCodeHelper = common::ErrorRegistry<UpdateErrorCode>;

class UpdateError : public std::runtime_error {
public:
    UpdateError(UpdateErrorCode code, const std::string& detail, common::ErrorContext context = {});
    
    UpdateErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }
    const common::ErrorContext& context() const noexcept { return context_; }

private:
    UpdateErrorCode code_;
    std::string detail_;
    common::ErrorContext context_;
};

}
}

namespace ps3_update {
namespace common {

template<>
inline const std::unordered_map<update::UpdateErrorCode, ErrorInfo<update::UpdateErrorCode>>& 
ErrorRegistry<update::UpdateErrorCode>::getInfoMap() {
    static const std::unordered_map<update::UpdateErrorCode, ErrorInfo<update::UpdateErrorCode>> map = {
        {update::UpdateErrorCode::NETWORK_ERROR, {
            update::UpdateErrorCode::NETWORK_ERROR,
            "NETWORK_ERROR",
            "Network error"
        }},
        {update::UpdateErrorCode::XML_PARSE_ERROR, {
            update::UpdateErrorCode::XML_PARSE_ERROR,
            "XML_PARSE_ERROR",
            "XML parsing error"
        }},
        {update::UpdateErrorCode::INVALID_IDENTIFIER, {
            update::UpdateErrorCode::INVALID_IDENTIFIER,
            "INVALID_IDENTIFIER",
            "Invalid title ID"
        }},
        {update::UpdateErrorCode::NO_UPDATES_FOUND, {
            update::UpdateErrorCode::NO_UPDATES_FOUND,
            "NO_UPDATES_FOUND",
            "No updates found for title ID"
        }},
        {update::UpdateErrorCode::FILESYSTEM_ERROR, {
            update::UpdateErrorCode::FILESYSTEM_ERROR,
            "FILESYSTEM_ERROR",
            "File system error"
        }},
        {update::UpdateErrorCode::DOWNLOAD_ERROR, {
            update::UpdateErrorCode::DOWNLOAD_ERROR,
            "DOWNLOAD_ERROR",
            "Download error"
        }},
        {update::UpdateErrorCode::TRANSFER_CANCELLED, {
            update::UpdateErrorCode::TRANSFER_CANCELLED,
            "TRANSFER_CANCELLED",
            "Transfer cancelled"
        }},
        {update::UpdateErrorCode::JOB_NOT_FOUND, {
            update::UpdateErrorCode::JOB_NOT_FOUND,
            "JOB_NOT_FOUND",
            "Job not found"
        }}
    };
    return map;
}

}
}
