#include "audio_input_device.hpp"
#include "audio_input_device_synthetic.hpp"
#include "audio_input_device_file.hpp"

namespace audio {

std::unique_ptr<IAudioInputDevice> AudioInputFactory::create_device(const std::string& device_id) {
    if (device_id.empty() || device_id == "synthetic") {
        return std::make_unique<AudioInputDevice_Synthetic>();
    }

    if (device_id.rfind("file:", 0) == 0 && device_id.size() > 5) {
        return std::make_unique<AudioInputDevice_File>();
    }

    return nullptr;
}

bool AudioInputFactory::is_device_available(const std::string& device_id) {
    if (device_id.empty() || device_id == "synthetic") {
        return true;
    }
    return device_id.rfind("file:", 0) == 0 && device_id.size() > 5;
}

} // namespace audio
