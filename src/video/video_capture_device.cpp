#include "video/video_capture_device.hpp"
#include "core/clock.hpp"

#include <algorithm>
#include <string>

namespace video {

bool VideoDevice_Synthetic::open(const VideoCaptureConfig& config) {
    if (config.width <= 0 || config.height <= 0 || config.fps <= 0) {
        return false;
    }
    config_ = config;
    frame_index_ = 0;
    open_ = true;
    return true;
}

bool VideoDevice_Synthetic::grab(VideoFrame& frame) {
    if (!open_) {
        return false;
    }

    const std::string header = "P5\n" + std::to_string(config_.width) + " " +
                               std::to_string(config_.height) + "\n255\n";
    const size_t pixels = static_cast<size_t>(config_.width) * static_cast<size_t>(config_.height);

    frame.data.resize(header.size() + pixels);
    std::copy(header.begin(), header.end(), frame.data.begin());

    uint8_t* px = frame.data.data() + header.size();
    const uint64_t shift = frame_index_ * 8;
    for (int y = 0; y < config_.height; ++y) {
        for (int x = 0; x < config_.width; ++x) {
            px[static_cast<size_t>(y) * config_.width + x] = static_cast<uint8_t>((x + y + shift) & 0xFF);
        }
    }

    frame.mime_type = "image/x-portable-graymap";
    frame.width = config_.width;
    frame.height = config_.height;
    frame.captured_at_ms = core::now_ms();
    frame_index_++;
    return true;
}

void VideoDevice_Synthetic::close() {
    open_ = false;
}

double VideoDevice_Synthetic::aspect_ratio() const {
    if (!open_ || config_.height == 0) {
        return 16.0 / 9.0;
    }
    return static_cast<double>(config_.width) / static_cast<double>(config_.height);
}

} // namespace video
