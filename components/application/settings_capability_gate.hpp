#ifndef APP_SETTINGS_CAPABILITY_GATE_HPP_
#define APP_SETTINGS_CAPABILITY_GATE_HPP_

#include <atomic>

#include "radio_gate.hpp"

namespace app {

/**
 * @class SettingsCapabilityGate
 * @brief Grants radio and microphone use according to the stored settings.
 */
class SettingsCapabilityGate : public voicelink::CapabilityGate {
   public:
    SettingsCapabilityGate(bool radio_allowed, bool microphone_allowed)
        : radio_allowed_(radio_allowed),
          microphone_allowed_(microphone_allowed) {}

    bool IsGranted(voicelink::Capability capability) const override {
        switch (capability) {
            case voicelink::Capability::kRadio:
                return radio_allowed_.load();
            case voicelink::Capability::kMicrophone:
                return microphone_allowed_.load();
        }
        return false;
    }

   private:
    std::atomic<bool> radio_allowed_;
    std::atomic<bool> microphone_allowed_;
};

}  // namespace app

#endif  // APP_SETTINGS_CAPABILITY_GATE_HPP_
