#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace video {

/**
 * @brief One encoded still ready for the uplink
 */
struct VideoFrame {
    std::vector<uint8_t> data;      // Encoded image bytes
    std::string mime_type;          // e.g. "image/jpeg"
    int width = 0;
    int height = 0;
    int64_t captured_at_ms = 0;
};

/**
 * @brief Requested capture format
 */
struct VideoCaptureConfig {
    std::string device_id;          // Empty = default device
    int width = 1280;
    int height = 720;
    int fps = 15;
};

/**
 * @brief Abstract base class for video capture devices
 *
 * Devices hand out encoded stills on demand; the session grabs one per frame
 * tick. Encoding mechanics belong to the device implementation.
 */
class IVideoCaptureDevice {
public:
    virtual ~IVideoCaptureDevice() = default;

    /// Acquire the device. Returns false if it cannot be opened.
    virtual bool open(const VideoCaptureConfig& config) = 0;

    /// Grab and encode the latest frame. Returns false if no frame is available.
    virtual bool grab(VideoFrame& frame) = 0;

    /// Release the device. Safe to call when closed.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Width / height of the opened stream (16/9 before open)
    virtual double aspect_ratio() const = 0;
};

/**
 * @brief Test-pattern camera producing PGM stills
 *
 * Frames are binary PGM (`image/x-portable-graymap`) with a moving diagonal
 * gradient so consecutive frames differ.
 */
class VideoDevice_Synthetic : public IVideoCaptureDevice {
public:
    bool open(const VideoCaptureConfig& config) override;
    bool grab(VideoFrame& frame) override;
    void close() override;
    bool is_open() const override { return open_; }
    double aspect_ratio() const override;

    uint64_t frames_grabbed() const { return frame_index_; }

private:
    VideoCaptureConfig config_;
    bool open_ = false;
    uint64_t frame_index_ = 0;
};

} // namespace video
