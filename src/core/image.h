// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_CORE_IMAGE_H_
#define SNAPBRIDGE_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace snapbridge {
namespace internal {

/// Decoded 8-bit-per-channel bitmap, rows packed top to bottom.
class Image {
 public:
  Image(int width, int height, int channels, std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int channels() const { return channels_; }
  int stride() const { return width_ * channels_; }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Get a mutable pointer to pixel data (for generators and tests to fill).
  uint8_t* mutable_data() { return data_.data(); }

  /// Create a zero-filled image.  Returns nullptr for non-positive sizes,
  /// unsupported channel counts, or buffers over the size limit.
  static std::unique_ptr<Image> Create(int width, int height, int channels);

  /// Create an image from existing data (takes ownership via move).
  static std::unique_ptr<Image> CreateFromData(int width, int height,
                                               int channels,
                                               std::vector<uint8_t> data);

  /// Aspect-preserving resize to `target_width`.  Never enlarges: when the
  /// image is already that narrow or narrower, a copy is returned.
  std::unique_ptr<Image> ResizeToWidth(int target_width) const;

  /// Height an aspect-preserving resize to `target_width` produces.
  int ScaledHeight(int target_width) const;

  /// Deep copy.
  std::unique_ptr<Image> Clone() const;

 private:
  int width_;
  int height_;
  int channels_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_IMAGE_H_
