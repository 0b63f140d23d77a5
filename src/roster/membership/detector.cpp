#include "roster/membership/detector.hpp"

namespace roster::membership {

    const char* to_string(DetectorKind k) noexcept {
        switch (k) {
            case DetectorKind::Recorder:       return "recorder";
            case DetectorKind::SipGatewayPool: return "sip_gateway_pool";
            case DetectorKind::SipRecorder:    return "sip_recorder";
        }
        return "unknown";
    }

} // namespace roster::membership
