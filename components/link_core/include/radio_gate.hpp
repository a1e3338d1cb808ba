#ifndef VOICELINK_RADIO_GATE_HPP_
#define VOICELINK_RADIO_GATE_HPP_

#include <functional>

#include "esp_err.h"

namespace voicelink {

enum class Capability {
    kRadio,       // Discovery and connections.
    kMicrophone,  // Audio capture.
};

/**
 * @class CapabilityGate
 * @brief Supplies the externally granted "may use X" signals.
 */
class CapabilityGate {
   public:
    virtual ~CapabilityGate() = default;
    virtual bool IsGranted(Capability capability) const = 0;
};

/**
 * @class RadioGate
 * @brief Reports whether the radio is usable and asks for it to be enabled.
 */
class RadioGate {
   public:
    using EnableCallback = std::function<void(bool enabled)>;

    virtual ~RadioGate() = default;

    virtual bool IsRadioEnabled() const = 0;

    /**
     * @brief Asks for the radio to be switched on.
     *
     * `done` is invoked exactly once, possibly from another task, with the
     * outcome. If the request cannot even be issued, an error is returned and
     * `done` is never called.
     */
    virtual esp_err_t RequestRadioEnable(EnableCallback done) = 0;
};

}  // namespace voicelink

#endif  // VOICELINK_RADIO_GATE_HPP_
