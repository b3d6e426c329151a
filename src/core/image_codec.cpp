// Copyright 2026 The snapbridge Authors
//
// Image codecs using stb_image (decode), stb_image_write (PNG, JPEG) and
// stb_image_resize2 (resampling).

#include "core/image_codec.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)  // sprintf deprecation in stb
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-function"
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO
#include "stb_image_write.h"

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize2.h"

#ifdef _MSC_VER
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include "core/bridge_error.h"
#include "core/image.h"
#include "core/logger.h"

namespace snapbridge {
namespace internal {

namespace {

// stb_image_write sink appending to a std::vector<uint8_t>.
void AppendToVector(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<uint8_t>*>(context);
  const auto* bytes = static_cast<const uint8_t*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

stbir_pixel_layout LayoutFor(int channels) {
  switch (channels) {
    case 1: return STBIR_1CHANNEL;
    case 3: return STBIR_RGB;
    default: return STBIR_RGBA;
  }
}

}  // namespace

std::unique_ptr<Image> DecodeImage(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) {
    throw BridgeError(kSnapBridgeErrorImageDecode, "Image data is empty");
  }

  int w = 0;
  int h = 0;
  int channels_in_file = 0;
  stbi_uc* pixels = stbi_load_from_memory(
      bytes.data(), static_cast<int>(bytes.size()), &w, &h,
      &channels_in_file, 3);
  if (!pixels) {
    const char* reason = stbi_failure_reason();
    throw BridgeError(kSnapBridgeErrorImageDecode,
                      std::string("Failed to decode image: ") +
                          (reason ? reason : "unknown error"));
  }

  size_t size = static_cast<size_t>(w) * static_cast<size_t>(h) * 3;
  std::vector<uint8_t> data(pixels, pixels + size);
  stbi_image_free(pixels);

  auto image = Image::CreateFromData(w, h, 3, std::move(data));
  if (!image) {
    throw BridgeError(kSnapBridgeErrorImageDecode,
                      "Decoded image has invalid dimensions");
  }
  SNAPBRIDGE_LOG_DEBUG("Decoded {}x{} image ({} channels in file)", w, h,
                       channels_in_file);
  return image;
}

std::vector<uint8_t> EncodeJpeg(const Image& image, int quality) {
  quality = std::clamp(quality, 1, 100);
  std::vector<uint8_t> out;
  int ok = stbi_write_jpg_to_func(AppendToVector, &out, image.width(),
                                  image.height(), image.channels(),
                                  image.data(), quality);
  if (!ok || out.empty()) {
    throw BridgeError(kSnapBridgeErrorImageEncode, "JPEG encoding failed");
  }
  return out;
}

std::vector<uint8_t> EncodePng(const Image& image) {
  std::vector<uint8_t> out;
  int ok = stbi_write_png_to_func(AppendToVector, &out, image.width(),
                                  image.height(), image.channels(),
                                  image.data(), image.stride());
  if (!ok || out.empty()) {
    throw BridgeError(kSnapBridgeErrorImageEncode, "PNG encoding failed");
  }
  return out;
}

std::unique_ptr<Image> ResampleImage(const Image& src, int width, int height) {
  auto dst = Image::Create(width, height, src.channels());
  if (!dst) return nullptr;
  unsigned char* result = stbir_resize_uint8_srgb(
      src.data(), src.width(), src.height(), src.stride(),
      dst->mutable_data(), width, height, dst->stride(),
      LayoutFor(src.channels()));
  if (!result) {
    SNAPBRIDGE_LOG_ERROR("Resample {}x{} -> {}x{} failed", src.width(),
                         src.height(), width, height);
    return nullptr;
  }
  return dst;
}

}  // namespace internal
}  // namespace snapbridge
