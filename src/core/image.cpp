// Copyright 2026 The snapbridge Authors

#include "core/image.h"

#include <cmath>
#include <utility>

#include "core/image_codec.h"

namespace snapbridge {
namespace internal {

namespace {

bool IsSupportedChannelCount(int channels) {
  return channels == 1 || channels == 3 || channels == 4;
}

}  // namespace

Image::Image(int width, int height, int channels, std::vector<uint8_t> data)
    : width_(width),
      height_(height),
      channels_(channels),
      data_(std::move(data)) {}

static constexpr size_t kMaxImageBytes = 512ULL * 1024 * 1024;  // 512 MB

// static
std::unique_ptr<Image> Image::Create(int width, int height, int channels) {
  if (width <= 0 || height <= 0 || !IsSupportedChannelCount(channels)) {
    return nullptr;
  }
  size_t total = static_cast<size_t>(width) * static_cast<size_t>(height) *
                 static_cast<size_t>(channels);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, channels, std::move(data));
}

// static
std::unique_ptr<Image> Image::CreateFromData(int width, int height,
                                             int channels,
                                             std::vector<uint8_t> data) {
  if (width <= 0 || height <= 0 || !IsSupportedChannelCount(channels)) {
    return nullptr;
  }
  size_t required = static_cast<size_t>(width) * static_cast<size_t>(height) *
                    static_cast<size_t>(channels);
  if (data.size() < required) return nullptr;
  return std::make_unique<Image>(width, height, channels, std::move(data));
}

int Image::ScaledHeight(int target_width) const {
  if (target_width >= width_) return height_;
  double scaled = static_cast<double>(height_) * target_width / width_;
  int h = static_cast<int>(std::lround(scaled));
  return h < 1 ? 1 : h;
}

std::unique_ptr<Image> Image::ResizeToWidth(int target_width) const {
  if (target_width <= 0 || target_width >= width_) return Clone();
  return ResampleImage(*this, target_width, ScaledHeight(target_width));
}

std::unique_ptr<Image> Image::Clone() const {
  std::vector<uint8_t> data_copy(data_);
  return std::make_unique<Image>(width_, height_, channels_,
                                 std::move(data_copy));
}

}  // namespace internal
}  // namespace snapbridge
