#include "src/video/v4l2_capture.h"

#include "common/util.hpp"

#include <linux/videodev2.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <time.h>
#include <unistd.h>

namespace video {

namespace {

bool xioctl(int fd, unsigned long req, void* arg) {
  for (;;) {
    const int rc = ::ioctl(fd, req, arg);
    if (rc == 0) return true;
    if (errno == EINTR) continue;
    return false;
  }
}

uint64_t monotonic_us() {
  timespec ts {};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000000ull + static_cast<uint64_t>(ts.tv_nsec / 1000ull);
}

std::string errno_string(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

} // namespace

V4L2Capture::V4L2Capture(CaptureConfig cfg) : cfg_(std::move(cfg)) {}

V4L2Capture::~V4L2Capture() { close(); }

bool V4L2Capture::open(std::string* err) {
  close();
  auto fail = [&](const std::string& msg) {
    if (err) *err = msg;
    common::log("video: capture error: " + msg);
    close();
    return false;
  };

  fd_ = ::open(cfg_.devicePath.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  if (fd_ < 0) return fail("failed to open " + cfg_.devicePath + ": " + std::strerror(errno));

  v4l2_format fmt {};
  fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (!xioctl(fd_, VIDIOC_G_FMT, &fmt)) return fail(errno_string("VIDIOC_G_FMT failed"));
  fmt.fmt.pix.width = cfg_.width;
  fmt.fmt.pix.height = cfg_.height;
  if (cfg_.fourcc != 0) fmt.fmt.pix.pixelformat = cfg_.fourcc;
  fmt.fmt.pix.field = V4L2_FIELD_ANY;
  if (!xioctl(fd_, VIDIOC_S_FMT, &fmt)) return fail(errno_string("VIDIOC_S_FMT failed"));
  outWidth_ = fmt.fmt.pix.width;
  outHeight_ = fmt.fmt.pix.height;
  outFourcc_ = fmt.fmt.pix.pixelformat;

  v4l2_streamparm parm {};
  parm.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  parm.parm.capture.timeperframe.numerator = cfg_.fpsNum ? cfg_.fpsNum : 1;
  parm.parm.capture.timeperframe.denominator = cfg_.fpsDen ? cfg_.fpsDen : 15;
  if (!xioctl(fd_, VIDIOC_S_PARM, &parm)) common::trace("video: VIDIOC_S_PARM not supported by " + cfg_.devicePath);

  v4l2_requestbuffers req {};
  req.count = 4;
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;
  if (!xioctl(fd_, VIDIOC_REQBUFS, &req) || req.count == 0) return fail(errno_string("VIDIOC_REQBUFS failed"));
  bufType_ = req.type;
  mmaps_.resize(req.count);

  for (uint32_t i = 0; i < req.count; ++i) {
    v4l2_buffer b {};
    b.type = req.type;
    b.memory = V4L2_MEMORY_MMAP;
    b.index = i;
    if (!xioctl(fd_, VIDIOC_QUERYBUF, &b)) return fail(errno_string("VIDIOC_QUERYBUF failed"));
    void* p = ::mmap(nullptr, b.length, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, b.m.offset);
    if (p == MAP_FAILED) return fail(errno_string("mmap failed"));
    mmaps_[i] = MmapBuf{p, b.length};
  }

  for (uint32_t i = 0; i < req.count; ++i) {
    v4l2_buffer b {};
    b.type = req.type;
    b.memory = V4L2_MEMORY_MMAP;
    b.index = i;
    if (!xioctl(fd_, VIDIOC_QBUF, &b)) return fail(errno_string("VIDIOC_QBUF failed"));
  }

  v4l2_buf_type t = static_cast<v4l2_buf_type>(req.type);
  if (!xioctl(fd_, VIDIOC_STREAMON, &t)) return fail(errno_string("VIDIOC_STREAMON failed"));
  streaming_ = true;

  common::log("video: capturing from " + cfg_.devicePath + " at " + std::to_string(outWidth_) + "x" +
              std::to_string(outHeight_));
  return true;
}

std::optional<RawFrame> V4L2Capture::grab(int timeoutMs, std::string* err) {
  if (err) err->clear();
  if (fd_ < 0 || !streaming_) {
    if (err) *err = "capture not open";
    return std::nullopt;
  }

  pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  const int prc = ::poll(&pfd, 1, timeoutMs);
  if (prc < 0) {
    if (errno == EINTR) return std::nullopt;
    if (err) *err = errno_string("poll failed");
    return std::nullopt;
  }
  if (prc == 0 || (pfd.revents & POLLIN) == 0) return std::nullopt;

  v4l2_buffer b {};
  b.type = bufType_;
  b.memory = V4L2_MEMORY_MMAP;
  if (!xioctl(fd_, VIDIOC_DQBUF, &b)) {
    if (errno == EAGAIN) return std::nullopt;
    if (err) *err = errno_string("VIDIOC_DQBUF failed");
    return std::nullopt;
  }

  std::optional<RawFrame> out;
  if (b.index < mmaps_.size() && b.bytesused > 0 && mmaps_[b.index].ptr) {
    RawFrame rf;
    rf.seq = seq_++;
    rf.monotonicUs = monotonic_us();
    rf.fourcc = outFourcc_;
    rf.width = outWidth_;
    rf.height = outHeight_;
    rf.bytes.resize(static_cast<size_t>(b.bytesused));
    std::memcpy(rf.bytes.data(), mmaps_[b.index].ptr, rf.bytes.size());
    out = std::move(rf);
  }

  if (!xioctl(fd_, VIDIOC_QBUF, &b)) {
    if (err) *err = errno_string("VIDIOC_QBUF failed in capture loop");
    return std::nullopt;
  }
  return out;
}

void V4L2Capture::close() {
  if (fd_ >= 0 && streaming_) {
    v4l2_buf_type t = static_cast<v4l2_buf_type>(bufType_);
    if (!xioctl(fd_, VIDIOC_STREAMOFF, &t)) common::trace(errno_string("video: VIDIOC_STREAMOFF failed"));
  }
  streaming_ = false;
  for (auto& mb : mmaps_) {
    if (mb.ptr && mb.len > 0) ::munmap(mb.ptr, mb.len);
  }
  mmaps_.clear();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace video
