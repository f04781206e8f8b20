#include "src/video/jpeg_codec.h"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

namespace {

constexpr uint32_t kYuyv = 'Y' | ('U' << 8) | ('Y' << 16) | ('V' << 24);

video::Image gradient(int w, int h) {
  video::Image img;
  img.width = w;
  img.height = h;
  img.rgb.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      uint8_t* p = &img.rgb[(static_cast<size_t>(y) * w + x) * 3];
      p[0] = static_cast<uint8_t>(x * 255 / w);
      p[1] = static_cast<uint8_t>(y * 255 / h);
      p[2] = 128;
    }
  }
  return img;
}

} // namespace

int main() {
  video::JpegParams params;
  params.width = 160;
  params.height = 120;
  params.quality = 80;

  video::JpegEncoder enc;
  std::string err;
  std::vector<uint8_t> jpeg;
  assert(!enc.encode(gradient(160, 120), &jpeg, &err));
  assert(err == "encoder not open");
  assert(enc.open(params, &err));

  // Encoded output is a JPEG that decodes at the opened geometry.
  assert(enc.encode(gradient(160, 120), &jpeg, &err));
  assert(jpeg.size() > 4);
  assert(jpeg[0] == 0xFF && jpeg[1] == 0xD8);

  video::JpegDecoder dec;
  assert(dec.open(&err));
  video::Image out;
  assert(dec.decode(jpeg.data(), jpeg.size(), &out, &err));
  assert(out.width == 160 && out.height == 120);
  assert(out.rgb.size() == 160u * 120u * 3u);

  // Input of another size is scaled to the opened geometry.
  assert(enc.encode(gradient(320, 240), &jpeg, &err));
  assert(dec.decode(jpeg.data(), jpeg.size(), &out, &err));
  assert(out.width == 160 && out.height == 120);

  assert(!enc.encode(video::Image{}, &jpeg, &err));

  // Garbage is rejected and the decoder keeps working afterwards.
  {
    std::vector<uint8_t> junk(512);
    for (size_t i = 0; i < junk.size(); ++i) junk[i] = static_cast<uint8_t>(i * 31 + 7);
    assert(!dec.decode(junk.data(), junk.size(), &out, &err));
    assert(!err.empty());
    assert(!dec.decode(nullptr, 0, &out, &err));

    std::vector<uint8_t> truncated(jpeg.begin(), jpeg.begin() + 2);
    assert(!dec.decode(truncated.data(), truncated.size(), &out, &err));

    assert(enc.encode(gradient(160, 120), &jpeg, &err));
    assert(dec.decode(jpeg.data(), jpeg.size(), &out, &err));
    assert(out.width == 160);
  }

  // A YUYV camera frame converts to RGB at the requested size.
  {
    video::RawFrame raw;
    raw.fourcc = kYuyv;
    raw.width = 64;
    raw.height = 48;
    raw.bytes.assign(64u * 48u * 2u, 0x80);
    assert(video::isInputFourccSupported(raw.fourcc));
    video::Image img;
    assert(video::rawFrameToImage(raw, 32, 24, &img, &err));
    assert(img.width == 32 && img.height == 24 && img.rgb.size() == 32u * 24u * 3u);

    raw.bytes.resize(10);
    assert(!video::rawFrameToImage(raw, 32, 24, &img, &err));
    assert(err == "short raw frame");

    raw.fourcc = 0x12345678;
    assert(!video::isInputFourccSupported(raw.fourcc));
    assert(!video::rawFrameToImage(raw, 32, 24, &img, &err));
  }

  // MJPEG camera frames go through the same path.
  {
    assert(enc.encode(gradient(160, 120), &jpeg, &err));
    video::RawFrame raw;
    raw.fourcc = 'M' | ('J' << 8) | ('P' << 16) | ('G' << 24);
    raw.width = 160;
    raw.height = 120;
    raw.bytes = jpeg;
    video::Image img;
    assert(video::rawFrameToImage(raw, 80, 60, &img, &err));
    assert(img.width == 80 && img.height == 60);
  }

  enc.close();
  assert(!enc.isOpen());
  dec.close();
  assert(!dec.isOpen());
  return 0;
}
