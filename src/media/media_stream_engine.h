#pragma once

#include "common/config.hpp"
#include "src/audio/alsa_device.h"
#include "src/call/call_signaling.h"
#include "src/video/jpeg_codec.h"
#include "src/video/v4l2_capture.h"
#include "src/video/video_packetizer.h"

#include <utility>  // before Boost 1.74 Asio, whose awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace media {

// Consumer of decoded video. `source` is "local" for the preview of our own
// camera, otherwise the sending peer's address. Called from media threads.
class FrameSink {
public:
  virtual ~FrameSink() = default;
  virtual void onFrame(const std::string& source, const video::Image& image) = 0;
};

// Logs frame geometry at most once per interval per source.
class LoggingFrameSink : public FrameSink {
public:
  explicit LoggingFrameSink(std::chrono::milliseconds interval = std::chrono::seconds(5)) : interval_(interval) {}
  void onFrame(const std::string& source, const video::Image& image) override;

private:
  std::chrono::milliseconds interval_;
  std::mutex mu_;
  std::vector<std::pair<std::string, std::chrono::steady_clock::time_point>> lastLogged_;
  std::vector<std::pair<std::string, uint64_t>> counts_;
};

struct MediaConfig {
  audio::AudioFormat audio;
  video::JpegParams video;
  size_t chunkThreshold = video::kDefaultChunkBytes;
  video::Reassembler::Limits reassembly;
  int recvTimeoutMs = 200;
};

struct MediaDevices {
  std::unique_ptr<audio::AudioCapture> microphone;
  std::unique_ptr<audio::AudioPlayback> speaker;
  std::unique_ptr<video::FrameSource> camera; // required only for video calls
};

struct MediaStats {
  uint64_t audioPacketsSent = 0;
  uint64_t audioPacketsReceived = 0;
  uint64_t videoFramesSent = 0;
  uint64_t videoFramesReceived = 0;
  uint64_t videoFramesDropped = 0;
};

// Duplex audio, plus duplex video for video calls. Each direction of each
// channel runs on its own thread; stop() signals all of them, joins them,
// then releases devices and sockets.
class MediaStreamEngine : public call::MediaSession {
public:
  MediaStreamEngine(call::CallSession session, MediaConfig cfg, MediaDevices devices, FrameSink* sink = nullptr);
  ~MediaStreamEngine() override;

  MediaStreamEngine(const MediaStreamEngine&) = delete;
  MediaStreamEngine& operator=(const MediaStreamEngine&) = delete;

  bool start(std::string* err) override;
  void stop() override;

  bool videoEnabled() const { return video_; }
  size_t runningTasks() const { return runningTasks_.load(); }
  MediaStats stats() const;

private:
  using udp = boost::asio::ip::udp;

  bool openSocket(udp::socket& s, uint16_t bindPort, std::string* err);
  // Waits up to recvTimeoutMs for the socket to become readable.
  bool waitReadable(udp::socket& s);
  // Sleeps for `d` or until stop() is called; returns false once stopping.
  bool pace(std::chrono::steady_clock::duration d);

  void audioSendLoop();
  void audioReceiveLoop();
  void videoSendLoop();
  void videoReceiveLoop();
  void closeAll();

  call::CallSession session_;
  MediaConfig cfg_;
  MediaDevices devices_;
  FrameSink* sink_;
  bool video_ = false;

  boost::asio::io_context io_;
  udp::endpoint peerAudio_;
  udp::endpoint peerVideo_;
  udp::socket audioRecv_;
  udp::socket audioSend_;
  udp::socket videoRecv_;
  udp::socket videoSend_;

  video::JpegEncoder encoder_;
  video::JpegDecoder decoder_;
  video::Reassembler reassembler_;

  std::atomic<bool> running_{false};
  std::atomic<size_t> runningTasks_{0};
  std::mutex stopMu_;
  std::condition_variable stopCv_;
  std::vector<std::thread> threads_;
  bool started_ = false;

  std::atomic<uint64_t> audioSent_{0};
  std::atomic<uint64_t> audioReceived_{0};
  std::atomic<uint64_t> videoSent_{0};
  std::atomic<uint64_t> videoReceived_{0};
  std::atomic<uint64_t> videoDropped_{0};
};

MediaConfig mediaConfigFrom(const common::Config& cfg);

// Builds engines backed by ALSA and V4L2 devices named in `cfg`. The camera
// is only opened for calls that carry video.
call::MediaFactory makeDeviceMediaFactory(const common::Config& cfg, FrameSink* sink);

} // namespace media
