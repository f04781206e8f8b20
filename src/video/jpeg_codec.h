#pragma once

#include "src/video/v4l2_capture.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace video {

// Tightly packed RGB24.
struct Image {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgb;

  bool empty() const { return width <= 0 || height <= 0 || rgb.empty(); }
};

struct JpegParams {
  int width = 640;
  int height = 480;
  int quality = 80; // 1..100
  int fps = 15;
};

bool isInputFourccSupported(uint32_t fourcc);

// Decodes or converts a captured frame and scales it to width x height.
bool rawFrameToImage(const RawFrame& in, int width, int height, Image* out, std::string* err = nullptr);

class JpegEncoder {
public:
  JpegEncoder();
  ~JpegEncoder();
  JpegEncoder(const JpegEncoder&) = delete;
  JpegEncoder& operator=(const JpegEncoder&) = delete;

  bool open(const JpegParams& p, std::string* err = nullptr);
  void close();
  bool isOpen() const;
  // Scales `in` to the opened geometry when it differs.
  bool encode(const Image& in, std::vector<uint8_t>* out, std::string* err = nullptr);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

class JpegDecoder {
public:
  JpegDecoder();
  ~JpegDecoder();
  JpegDecoder(const JpegDecoder&) = delete;
  JpegDecoder& operator=(const JpegDecoder&) = delete;

  bool open(std::string* err = nullptr);
  void close();
  bool isOpen() const;
  // False for corrupt or truncated input; the decoder stays usable.
  bool decode(const uint8_t* data, size_t len, Image* out, std::string* err = nullptr);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace video
