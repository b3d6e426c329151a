// Copyright 2026 The snapbridge Authors

#ifndef SNAPBRIDGE_CAPTURE_IMAGE_COMPRESSOR_H_
#define SNAPBRIDGE_CAPTURE_IMAGE_COMPRESSOR_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace snapbridge {
namespace internal {

class Image;

/// A resize-and-requality fallback step.
struct CompressionStage {
  int max_width;
  int quality;
};

struct CompressionPolicy {
  size_t byte_budget = 950 * 1024;
  int max_width = 1920;
  int quality_floor = 20;
  int quality_step = 10;
  std::vector<CompressionStage> fallback_stages = {{1280, 60}, {800, 50}};
};

struct CompressedImage {
  std::vector<uint8_t> jpeg;
  int quality = 0;
  int width = 0;
  int height = 0;
  bool resized = false;
  int encode_count = 0;

  bool within(size_t budget) const { return jpeg.size() <= budget; }
};

/// Shrinks a lossless bitmap into a JPEG that fits the policy budget.
///
/// Order: cap width at max_width, encode at the requested quality, lower
/// quality in steps while above the floor, then re-encode the original at
/// each fallback stage.  The last stage is returned whatever its size.
/// Every attempt starts from the original pixels, never a lossy re-encode.
class ImageCompressor {
 public:
  explicit ImageCompressor(CompressionPolicy policy = CompressionPolicy());

  CompressedImage Compress(const Image& original, int quality) const;

  /// Decode PNG bytes then Compress().
  CompressedImage CompressPng(const std::vector<uint8_t>& png,
                              int quality) const;

  const CompressionPolicy& policy() const { return policy_; }

 private:
  CompressionPolicy policy_;
};

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CAPTURE_IMAGE_COMPRESSOR_H_
