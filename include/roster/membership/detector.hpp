#pragma once
/**
 * @file detector.hpp
 * @brief Worker-pool detectors constructed by the registry from brewery names.
 * @details A detector watches one brewery room where worker instances
 *          (recorders, SIP gateways) announce themselves. Its polling and
 *          health scheduling are its own business; the registry only creates,
 *          starts and releases it.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace roster::membership {

/** @enum DetectorKind
 *  @brief Which worker pool a detector manages.
 */
enum class DetectorKind : std::uint8_t {
    Recorder = 0,       ///< Recording/streaming workers
    SipGatewayPool = 1, ///< Audio SIP gateway workers
    SipRecorder = 2     ///< Video SIP gateway (recorder in SIP mode) workers
};

/// Number of DetectorKind values; sizes per-kind tables.
inline constexpr std::size_t kDetectorKinds = 3;

const char* to_string(DetectorKind k) noexcept;

/** @class Detector
 *  @brief Lifecycle surface of a worker-pool detector.
 */
class Detector {
public:
    virtual ~Detector() = default;
    virtual void init() = 0;
    virtual void dispose() = 0;
    virtual DetectorKind kind() const noexcept = 0;
    /// Brewery room the detector watches.
    virtual const std::string& brewery() const noexcept = 0;
};

/** @class DetectorFactory
 *  @brief Supplied by the embedding process; builds detectors on demand.
 */
class DetectorFactory {
public:
    virtual ~DetectorFactory() = default;
    /// @return The detector, or nullptr if this kind cannot be provided.
    virtual std::unique_ptr<Detector> create(DetectorKind kind, const std::string& brewery) = 0;
};

} // namespace roster::membership
