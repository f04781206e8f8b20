#include "src/media/media_stream_engine.h"

#include "common/util.hpp"

#include <poll.h>

#include <algorithm>

namespace media {

namespace {

constexpr size_t kMaxDatagram = 65536;

uint64_t steady_ms() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

void close_socket(boost::asio::ip::udp::socket& s, const char* what) {
  if (!s.is_open()) return;
  boost::system::error_code ec;
  s.close(ec);
  if (ec) common::trace(std::string("media: close ") + what + ": " + ec.message());
}

} // namespace

void LoggingFrameSink::onFrame(const std::string& source, const video::Image& image) {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard lk(mu_);

  auto count = std::find_if(counts_.begin(), counts_.end(), [&](const auto& e) { return e.first == source; });
  if (count == counts_.end()) {
    counts_.emplace_back(source, 0);
    count = counts_.end() - 1;
  }
  ++count->second;

  auto last = std::find_if(lastLogged_.begin(), lastLogged_.end(), [&](const auto& e) { return e.first == source; });
  if (last != lastLogged_.end() && now - last->second < interval_) return;
  if (last == lastLogged_.end()) {
    lastLogged_.emplace_back(source, now);
  } else {
    last->second = now;
  }
  common::log("video: " + source + " " + std::to_string(image.width) + "x" + std::to_string(image.height) + " (" +
              std::to_string(count->second) + " frames)");
}

MediaStreamEngine::MediaStreamEngine(call::CallSession session, MediaConfig cfg, MediaDevices devices, FrameSink* sink)
    : session_(std::move(session)),
      cfg_(cfg),
      devices_(std::move(devices)),
      sink_(sink),
      audioRecv_(io_),
      audioSend_(io_),
      videoRecv_(io_),
      videoSend_(io_),
      reassembler_(cfg.reassembly) {
  video_ = protocol::callKindHasVideo(session_.kind) && session_.peerPorts.video != 0;
}

MediaStreamEngine::~MediaStreamEngine() { stop(); }

bool MediaStreamEngine::openSocket(udp::socket& s, uint16_t bindPort, std::string* err) {
  boost::system::error_code ec;
  s.open(udp::v4(), ec);
  if (!ec && bindPort != 0) {
    s.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) s.bind(udp::endpoint(udp::v4(), bindPort), ec);
  }
  if (ec) {
    if (err) *err = "udp socket on port " + std::to_string(bindPort) + ": " + ec.message();
    return false;
  }
  return true;
}

bool MediaStreamEngine::start(std::string* err) {
  if (started_) {
    if (err) *err = "media already started";
    return false;
  }
  auto fail = [&](const std::string& msg) {
    if (err) *err = msg;
    common::log("media: " + msg);
    closeAll();
    return false;
  };

  boost::system::error_code ec;
  const auto peerAddr = boost::asio::ip::make_address_v4(session_.peerIp, ec);
  if (ec) return fail("bad peer address " + session_.peerIp);
  peerAudio_ = udp::endpoint(peerAddr, session_.peerPorts.audio);
  peerVideo_ = udp::endpoint(peerAddr, session_.peerPorts.video);

  if (!devices_.microphone || !devices_.speaker) return fail("no audio device");
  std::string devErr;
  if (!devices_.microphone->open(cfg_.audio, &devErr)) return fail("microphone unavailable: " + devErr);
  if (!devices_.speaker->open(cfg_.audio, &devErr)) return fail("speaker unavailable: " + devErr);

  if (!openSocket(audioRecv_, session_.localPorts.audio, &devErr)) return fail(devErr);
  if (!openSocket(audioSend_, 0, &devErr)) return fail(devErr);

  if (video_) {
    if (!devices_.camera) return fail("no camera");
    if (!devices_.camera->open(&devErr)) return fail("camera unavailable: " + devErr);
    if (!encoder_.open(cfg_.video, &devErr)) return fail("jpeg encoder: " + devErr);
    if (!decoder_.open(&devErr)) return fail("jpeg decoder: " + devErr);
    if (!openSocket(videoRecv_, session_.localPorts.video, &devErr)) return fail(devErr);
    if (!openSocket(videoSend_, 0, &devErr)) return fail(devErr);
  }

  started_ = true;
  running_ = true;
  threads_.emplace_back([this] { audioSendLoop(); });
  threads_.emplace_back([this] { audioReceiveLoop(); });
  if (video_) {
    threads_.emplace_back([this] { videoSendLoop(); });
    threads_.emplace_back([this] { videoReceiveLoop(); });
  }
  common::log("media: streaming " + std::string(video_ ? "audio+video" : "audio") + " with " + session_.peerIp);
  return true;
}

void MediaStreamEngine::stop() {
  {
    std::lock_guard lk(stopMu_);
    running_ = false;
  }
  stopCv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  const bool wasStarted = !threads_.empty();
  threads_.clear();
  closeAll();
  if (wasStarted) {
    common::log("media: stopped (audio out " + std::to_string(audioSent_.load()) + ", in " +
                std::to_string(audioReceived_.load()) + "; video out " + std::to_string(videoSent_.load()) + ", in " +
                std::to_string(videoReceived_.load()) + ")");
  }
}

void MediaStreamEngine::closeAll() {
  if (devices_.microphone) devices_.microphone->close();
  if (devices_.speaker) devices_.speaker->close();
  if (devices_.camera) devices_.camera->close();
  encoder_.close();
  decoder_.close();
  close_socket(audioRecv_, "audio receive");
  close_socket(audioSend_, "audio send");
  close_socket(videoRecv_, "video receive");
  close_socket(videoSend_, "video send");
  reassembler_.clear();
}

MediaStats MediaStreamEngine::stats() const {
  MediaStats s;
  s.audioPacketsSent = audioSent_.load();
  s.audioPacketsReceived = audioReceived_.load();
  s.videoFramesSent = videoSent_.load();
  s.videoFramesReceived = videoReceived_.load();
  s.videoFramesDropped = videoDropped_.load();
  return s;
}

bool MediaStreamEngine::waitReadable(udp::socket& s) {
  pollfd pfd {};
  pfd.fd = s.native_handle();
  pfd.events = POLLIN;
  const int rc = ::poll(&pfd, 1, cfg_.recvTimeoutMs);
  return rc > 0 && (pfd.revents & POLLIN) != 0;
}

bool MediaStreamEngine::pace(std::chrono::steady_clock::duration d) {
  std::unique_lock lk(stopMu_);
  stopCv_.wait_for(lk, d, [this] { return !running_.load(); });
  return running_.load();
}

void MediaStreamEngine::audioSendLoop() {
  ++runningTasks_;
  std::vector<uint8_t> packet;
  std::string err;
  bool reported = false;
  while (running_) {
    if (!devices_.microphone->read(&packet, cfg_.recvTimeoutMs, &err)) {
      if (!err.empty() && !reported) {
        common::log("media: microphone read failed: " + err);
        reported = true;
      }
      if (!err.empty() && !pace(std::chrono::milliseconds(cfg_.recvTimeoutMs))) break;
      continue;
    }
    boost::system::error_code ec;
    audioSend_.send_to(boost::asio::buffer(packet), peerAudio_, 0, ec);
    if (ec) {
      common::trace("media: audio send: " + ec.message());
      continue;
    }
    ++audioSent_;
  }
  --runningTasks_;
}

void MediaStreamEngine::audioReceiveLoop() {
  ++runningTasks_;
  std::vector<uint8_t> buf(kMaxDatagram);
  std::string err;
  while (running_) {
    if (!waitReadable(audioRecv_)) continue;
    udp::endpoint from;
    boost::system::error_code ec;
    const size_t n = audioRecv_.receive_from(boost::asio::buffer(buf), from, 0, ec);
    if (ec) {
      common::trace("media: audio receive: " + ec.message());
      continue;
    }
    if (n == 0 || from.address() != peerAudio_.address()) continue;
    ++audioReceived_;
    if (!devices_.speaker->write(std::span<const uint8_t>(buf.data(), n), &err)) {
      common::trace("media: playback: " + err);
    }
  }
  --runningTasks_;
}

void MediaStreamEngine::videoSendLoop() {
  ++runningTasks_;
  const int fps = std::max(1, cfg_.video.fps);
  const auto period = std::chrono::microseconds(1000000 / fps);
  std::string err;
  bool reported = false;
  video::Image image;
  std::vector<uint8_t> jpeg;

  while (running_) {
    const auto began = std::chrono::steady_clock::now();
    auto frame = devices_.camera->grab(cfg_.recvTimeoutMs, &err);
    if (!frame) {
      if (!err.empty()) {
        if (!reported) common::log("media: camera: " + err);
        reported = true;
        if (!pace(period)) break;
      }
      continue;
    }

    if (!video::rawFrameToImage(*frame, cfg_.video.width, cfg_.video.height, &image, &err) ||
        !encoder_.encode(image, &jpeg, &err)) {
      common::trace("media: video encode: " + err);
      continue;
    }
    if (sink_) sink_->onFrame("local", image);

    bool sent = true;
    for (const auto& datagram : video::packetizeFrame(jpeg.data(), jpeg.size(), cfg_.chunkThreshold)) {
      boost::system::error_code ec;
      videoSend_.send_to(boost::asio::buffer(datagram), peerVideo_, 0, ec);
      if (ec) {
        common::trace("media: video send: " + ec.message());
        sent = false;
        break;
      }
    }
    if (sent) ++videoSent_;

    const auto spent = std::chrono::steady_clock::now() - began;
    if (spent < period && !pace(period - spent)) break;
  }
  --runningTasks_;
}

void MediaStreamEngine::videoReceiveLoop() {
  ++runningTasks_;
  std::vector<uint8_t> buf(kMaxDatagram);
  video::ParsedDatagram parsed;
  video::Image image;
  std::string err;

  while (running_) {
    const bool readable = waitReadable(videoRecv_);
    reassembler_.expire(steady_ms());
    if (!readable) continue;

    udp::endpoint from;
    boost::system::error_code ec;
    const size_t n = videoRecv_.receive_from(boost::asio::buffer(buf), from, 0, ec);
    if (ec) {
      common::trace("media: video receive: " + ec.message());
      continue;
    }
    if (from.address() != peerVideo_.address()) continue;
    if (!video::parseDatagram(buf.data(), n, &parsed)) {
      ++videoDropped_;
      continue;
    }

    auto frame = reassembler_.add(common::endpoint_to_string(from), std::move(parsed), steady_ms());
    parsed = video::ParsedDatagram{};
    if (!frame) continue;

    if (!decoder_.decode(frame->data(), frame->size(), &image, &err)) {
      ++videoDropped_;
      common::trace("media: dropped undecodable frame: " + err);
      continue;
    }
    ++videoReceived_;
    if (sink_) sink_->onFrame(session_.peerIp, image);
  }
  --runningTasks_;
}

MediaConfig mediaConfigFrom(const common::Config& cfg) {
  MediaConfig m;
  m.audio.rate = cfg.audio_rate;
  m.audio.channels = cfg.audio_channels;
  m.audio.framesPerPacket = cfg.audio_frames_per_packet;
  m.video.width = cfg.video_width;
  m.video.height = cfg.video_height;
  m.video.quality = cfg.jpeg_quality;
  m.video.fps = cfg.video_fps;
  m.chunkThreshold = cfg.video_chunk_threshold;
  m.reassembly.timeoutMs = static_cast<uint64_t>(cfg.reassembly_timeout.count());
  return m;
}

call::MediaFactory makeDeviceMediaFactory(const common::Config& cfg, FrameSink* sink) {
  return [cfg, sink](const call::CallSession& session) -> std::unique_ptr<call::MediaSession> {
    MediaDevices devices;
    devices.microphone = std::make_unique<audio::AlsaCapture>(cfg.audio_device);
    devices.speaker = std::make_unique<audio::AlsaPlayback>(cfg.audio_device);
    if (protocol::callKindHasVideo(session.kind)) {
      video::CaptureConfig cap;
      cap.devicePath = cfg.video_device;
      cap.width = static_cast<uint32_t>(cfg.video_width);
      cap.height = static_cast<uint32_t>(cfg.video_height);
      cap.fpsDen = static_cast<uint32_t>(std::max(1, cfg.video_fps));
      devices.camera = std::make_unique<video::V4L2Capture>(cap);
    }
    return std::make_unique<MediaStreamEngine>(session, mediaConfigFrom(cfg), std::move(devices), sink);
  };
}

} // namespace media
