#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

typedef struct _snd_pcm snd_pcm_t;

namespace audio {

// Interleaved signed 16-bit little-endian PCM.
struct AudioFormat {
  int rate = 44100;
  int channels = 1;
  int framesPerPacket = 1024;

  size_t bytesPerFrame() const { return static_cast<size_t>(channels) * 2; }
  size_t packetBytes() const { return bytesPerFrame() * static_cast<size_t>(framesPerPacket); }
};

class AudioCapture {
public:
  virtual ~AudioCapture() = default;
  virtual bool open(const AudioFormat& fmt, std::string* err) = 0;
  // Fills `out` with exactly one packet. Returns false with an empty `err`
  // when timeoutMs passed first; partial data is kept for the next call.
  virtual bool read(std::vector<uint8_t>* out, int timeoutMs, std::string* err) = 0;
  virtual void close() = 0;
};

class AudioPlayback {
public:
  virtual ~AudioPlayback() = default;
  virtual bool open(const AudioFormat& fmt, std::string* err) = 0;
  virtual bool write(std::span<const uint8_t> pcm, std::string* err) = 0;
  virtual void close() = 0;
};

class AlsaCapture : public AudioCapture {
public:
  explicit AlsaCapture(std::string device = "default") : device_(std::move(device)) {}
  ~AlsaCapture() override { close(); }

  AlsaCapture(const AlsaCapture&) = delete;
  AlsaCapture& operator=(const AlsaCapture&) = delete;

  bool open(const AudioFormat& fmt, std::string* err) override;
  bool read(std::vector<uint8_t>* out, int timeoutMs, std::string* err) override;
  void close() override;

private:
  std::string device_;
  AudioFormat fmt_;
  snd_pcm_t* pcm_ = nullptr;
  std::vector<uint8_t> pending_;
  size_t filled_ = 0;
};

class AlsaPlayback : public AudioPlayback {
public:
  explicit AlsaPlayback(std::string device = "default") : device_(std::move(device)) {}
  ~AlsaPlayback() override { close(); }

  AlsaPlayback(const AlsaPlayback&) = delete;
  AlsaPlayback& operator=(const AlsaPlayback&) = delete;

  bool open(const AudioFormat& fmt, std::string* err) override;
  bool write(std::span<const uint8_t> pcm, std::string* err) override;
  void close() override;

private:
  std::string device_;
  AudioFormat fmt_;
  snd_pcm_t* pcm_ = nullptr;
};

} // namespace audio
