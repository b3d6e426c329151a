// Copyright 2026 The snapbridge Authors
//
// PNG decoding, JPEG/PNG encoding to memory, and resampling (stb).

#ifndef SNAPBRIDGE_CORE_IMAGE_CODEC_H_
#define SNAPBRIDGE_CORE_IMAGE_CODEC_H_

#include <cstdint>
#include <memory>
#include <vector>

namespace snapbridge {
namespace internal {

class Image;

/// Decode PNG (or any stb_image-supported format) into an RGB image.
/// Throws BridgeError(kSnapBridgeErrorImageDecode) on malformed input.
std::unique_ptr<Image> DecodeImage(const std::vector<uint8_t>& bytes);

/// Encode as baseline JPEG at `quality` (clamped to 1..100).
/// Throws BridgeError(kSnapBridgeErrorImageEncode) on failure.
std::vector<uint8_t> EncodeJpeg(const Image& image, int quality);

/// Encode as PNG.  Throws BridgeError(kSnapBridgeErrorImageEncode).
std::vector<uint8_t> EncodePng(const Image& image);

/// Resample `src` to exactly `width` x `height`.  Returns nullptr on failure.
std::unique_ptr<Image> ResampleImage(const Image& src, int width, int height);

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CORE_IMAGE_CODEC_H_
