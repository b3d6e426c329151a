// Copyright 2026 The snapbridge Authors

#include "capture/image_compressor.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "core/bridge_error.h"
#include "core/image.h"
#include "core/image_codec.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

std::unique_ptr<Image> ResizeOrThrow(const Image& original, int width) {
  auto resized = original.ResizeToWidth(width);
  if (!resized) {
    throw BridgeError(kSnapBridgeErrorImageEncode,
                      "Failed to resize image to " + std::to_string(width) +
                          "px width");
  }
  return resized;
}

}  // namespace

ImageCompressor::ImageCompressor(CompressionPolicy policy)
    : policy_(std::move(policy)) {}

CompressedImage ImageCompressor::Compress(const Image& original,
                                          int quality) const {
  CompressedImage out;
  out.quality = std::clamp(quality, 1, 100);

  // Stage 1: cap the width, keep the requested quality.
  std::unique_ptr<Image> scaled;
  const Image* working = &original;
  if (original.width() > policy_.max_width) {
    scaled = ResizeOrThrow(original, policy_.max_width);
    working = scaled.get();
    out.resized = true;
  }

  auto encode = [&out](const Image& img, int q) {
    out.jpeg = EncodeJpeg(img, q);
    out.quality = q;
    out.width = img.width();
    out.height = img.height();
    ++out.encode_count;
    SNAPBRIDGE_LOG_DEBUG("JPEG {}x{} q{} -> {} bytes", img.width(),
                         img.height(), q, out.jpeg.size());
  };

  encode(*working, out.quality);

  // Stage 2: step quality down on the same bitmap.
  while (out.jpeg.size() > policy_.byte_budget &&
         out.quality > policy_.quality_floor) {
    encode(*working, std::max(1, out.quality - policy_.quality_step));
  }

  // Stage 3+: shrink the original.
  for (const auto& stage : policy_.fallback_stages) {
    if (out.jpeg.size() <= policy_.byte_budget) break;
    auto smaller = ResizeOrThrow(original, stage.max_width);
    if (smaller->width() < original.width()) out.resized = true;
    encode(*smaller, stage.quality);
  }

  if (out.jpeg.size() > policy_.byte_budget) {
    SNAPBRIDGE_LOG_WARN("Image still {} bytes after final stage (budget {})",
                        out.jpeg.size(), policy_.byte_budget);
  }
  return out;
}

CompressedImage ImageCompressor::CompressPng(const std::vector<uint8_t>& png,
                                             int quality) const {
  auto image = DecodeImage(png);
  SNAPBRIDGE_LOG_INFO("Compressing {}x{} capture ({} bytes PNG)",
                      image->width(), image->height(), png.size());
  return Compress(*image, quality);
}

}  // namespace internal
}  // namespace snapbridge
