#include "quickroll/core/types.hpp"

namespace quickroll {

const char* to_string(RecognitionStatus status) {
    switch (status) {
        case RecognitionStatus::RECOGNIZED: return "RECOGNIZED";
        case RecognitionStatus::MAYBE:      return "MAYBE";
        case RecognitionStatus::UNKNOWN:    return "UNKNOWN";
        case RecognitionStatus::COOLDOWN:   return "COOLDOWN";
        case RecognitionStatus::NO_FACE:    return "NO_FACE";
    }
    return "UNKNOWN";
}

}  // namespace quickroll
