#include "audio/capture_resampler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>

namespace audio {

CaptureResampler::CaptureResampler(int native_rate, int target_rate, size_t max_frame_samples)
    : native_rate_(native_rate > 0 ? native_rate : target_rate)
    , target_rate_(target_rate > 0 ? target_rate : 16000)
    , max_frame_samples_(std::max<size_t>(1, max_frame_samples)) {
    step_ = static_cast<double>(native_rate_) / static_cast<double>(target_rate_);
    const size_t out_cap = max_output_samples(max_frame_samples_);
    resampled_.resize(out_cap);
    packed_.resize(out_cap * 2);
}

size_t CaptureResampler::max_output_samples(size_t frames) const {
    return static_cast<size_t>(static_cast<double>(frames) / step_) + 2;
}

void CaptureResampler::ensure_capacity(size_t count) {
    if (count <= max_frame_samples_) return;
    if (!warned_grow_) {
        core::log_warn("CaptureResampler: frame of " + std::to_string(count) +
                       " samples exceeds preallocated " + std::to_string(max_frame_samples_) + ", growing");
        warned_grow_ = true;
    }
    max_frame_samples_ = count;
    const size_t out_cap = max_output_samples(count);
    resampled_.resize(out_cap);
    packed_.resize(out_cap * 2);
}

size_t CaptureResampler::process(const int16_t* samples, size_t count) {
    resampled_count_ = 0;
    packed_size_ = 0;
    if (samples == nullptr || count == 0) {
        return 0;
    }
    ensure_capacity(count);

    if (!has_prev_) {
        pos_ = 0.0;
    }

    const double last = static_cast<double>(count - 1);
    size_t k = 0;
    while (pos_ < last) {
        const double fl = std::floor(pos_);
        const long i0 = static_cast<long>(fl);
        const double frac = pos_ - fl;
        const double s0 = (i0 < 0) ? prev_ : samples[i0];
        const double s1 = samples[i0 + 1];
        const int v = static_cast<int>(std::lrint(s0 + frac * (s1 - s0)));
        resampled_[k++] = static_cast<int16_t>(std::clamp(v, -32768, 32767));
        pos_ += step_;
    }
    pos_ -= static_cast<double>(count);
    prev_ = samples[count - 1];
    has_prev_ = true;

    for (size_t i = 0; i < k; ++i) {
        const uint16_t u = static_cast<uint16_t>(resampled_[i]);
        packed_[2 * i] = static_cast<uint8_t>(u & 0xFF);
        packed_[2 * i + 1] = static_cast<uint8_t>(u >> 8);
    }
    resampled_count_ = k;
    packed_size_ = k * 2;
    return packed_size_;
}

void CaptureResampler::reset() {
    pos_ = 0.0;
    prev_ = 0;
    has_prev_ = false;
    resampled_count_ = 0;
    packed_size_ = 0;
}

} // namespace audio
