#include "ps3_update/update/error_codes.hpp"
#include <utility>

namespace ps3_update {
namespace update {

namespace {

std::string buildMessage(UpdateErrorCode code, const std::string& detail) {
    std::string message = UpdateErrorCodeHelper::getMessage(code);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}

UpdateError::UpdateError(UpdateErrorCode code, const std::string& detail, common::ErrorContext context)
    : std::runtime_error(buildMessage(code, detail)),
      code_(code),
      detail_(detail),
      context_(std::move(context)) {}

}}
