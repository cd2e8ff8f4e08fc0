#include "ps3_update/common/types.hpp"

namespace ps3_update {
namespace common {

std::string to_string(TransferMode mode) {
    switch (mode.kind) {
        case TransferMode::Kind::DIRECT:
            return "direct";
        case TransferMode::Kind::MULTI_PART:
            return "multipart(" + std::to_string(mode.parts) + ")";
    }
    return "unknown";
}

}}
