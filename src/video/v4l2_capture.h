#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace video {

struct RawFrame {
  uint64_t seq = 0;
  uint64_t monotonicUs = 0;
  uint32_t fourcc = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> bytes;
};

struct CaptureConfig {
  std::string devicePath = "/dev/video0";
  uint32_t fourcc = 0; // 0 lets the driver keep its current format
  uint32_t width = 640;
  uint32_t height = 480;
  uint32_t fpsNum = 1;
  uint32_t fpsDen = 15;
};

// Pull-style camera. grab() waits at most timeoutMs so the caller can
// observe its own stop condition between frames.
class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual bool open(std::string* err) = 0;
  // nullopt with an empty `err` means the wait timed out.
  virtual std::optional<RawFrame> grab(int timeoutMs, std::string* err) = 0;
  virtual void close() = 0;
};

class V4L2Capture : public FrameSource {
public:
  explicit V4L2Capture(CaptureConfig cfg);
  ~V4L2Capture() override;

  V4L2Capture(const V4L2Capture&) = delete;
  V4L2Capture& operator=(const V4L2Capture&) = delete;

  bool open(std::string* err) override;
  std::optional<RawFrame> grab(int timeoutMs, std::string* err) override;
  void close() override;
  bool isOpen() const { return fd_ >= 0; }

private:
  struct MmapBuf {
    void* ptr = nullptr;
    size_t len = 0;
  };

  CaptureConfig cfg_;
  int fd_ = -1;
  uint32_t bufType_ = 0;
  uint32_t outFourcc_ = 0;
  uint32_t outWidth_ = 0;
  uint32_t outHeight_ = 0;
  uint64_t seq_ = 0;
  bool streaming_ = false;
  std::vector<MmapBuf> mmaps_;
};

} // namespace video
