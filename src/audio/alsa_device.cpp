#include "src/audio/alsa_device.h"

#include "common/util.hpp"

#include <alsa/asoundlib.h>

namespace audio {

namespace {

constexpr unsigned int kLatencyUs = 100000;

bool open_pcm(snd_pcm_t** pcm, const std::string& device, snd_pcm_stream_t stream, int mode, const AudioFormat& fmt,
              std::string* err) {
  int rc = snd_pcm_open(pcm, device.c_str(), stream, mode);
  if (rc < 0) {
    if (err) *err = "snd_pcm_open(" + device + ") failed: " + snd_strerror(rc);
    *pcm = nullptr;
    return false;
  }
  rc = snd_pcm_set_params(*pcm, SND_PCM_FORMAT_S16_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                          static_cast<unsigned int>(fmt.channels), static_cast<unsigned int>(fmt.rate), 1, kLatencyUs);
  if (rc < 0) {
    if (err) *err = "snd_pcm_set_params failed: " + std::string(snd_strerror(rc));
    snd_pcm_close(*pcm);
    *pcm = nullptr;
    return false;
  }
  return true;
}

} // namespace

bool AlsaCapture::open(const AudioFormat& fmt, std::string* err) {
  close();
  fmt_ = fmt;
  if (!open_pcm(&pcm_, device_, SND_PCM_STREAM_CAPTURE, SND_PCM_NONBLOCK, fmt, err)) return false;
  pending_.assign(fmt_.packetBytes(), 0);
  filled_ = 0;
  const int rc = snd_pcm_start(pcm_);
  if (rc < 0) common::trace("audio: snd_pcm_start: " + std::string(snd_strerror(rc)));
  common::log("audio: capture open on " + device_ + " (" + std::to_string(fmt_.rate) + " Hz, " +
              std::to_string(fmt_.channels) + " ch)");
  return true;
}

bool AlsaCapture::read(std::vector<uint8_t>* out, int timeoutMs, std::string* err) {
  if (err) err->clear();
  if (!pcm_) {
    if (err) *err = "capture not open";
    return false;
  }

  while (filled_ < pending_.size()) {
    const int ready = snd_pcm_wait(pcm_, timeoutMs);
    if (ready == 0) return false;
    if (ready < 0) {
      const int rc = snd_pcm_recover(pcm_, ready, 1);
      if (rc < 0) {
        if (err) *err = "snd_pcm_wait failed: " + std::string(snd_strerror(ready));
        return false;
      }
      continue;
    }

    const auto wantFrames = static_cast<snd_pcm_uframes_t>((pending_.size() - filled_) / fmt_.bytesPerFrame());
    const snd_pcm_sframes_t got = snd_pcm_readi(pcm_, pending_.data() + filled_, wantFrames);
    if (got == -EAGAIN) continue;
    if (got < 0) {
      // Overruns are expected when the sender falls behind; recover and keep going.
      const int rc = snd_pcm_recover(pcm_, static_cast<int>(got), 1);
      if (rc < 0) {
        if (err) *err = "snd_pcm_readi failed: " + std::string(snd_strerror(static_cast<int>(got)));
        return false;
      }
      continue;
    }
    filled_ += static_cast<size_t>(got) * fmt_.bytesPerFrame();
  }

  out->assign(pending_.begin(), pending_.end());
  filled_ = 0;
  return true;
}

void AlsaCapture::close() {
  if (!pcm_) return;
  snd_pcm_drop(pcm_);
  snd_pcm_close(pcm_);
  pcm_ = nullptr;
  filled_ = 0;
}

bool AlsaPlayback::open(const AudioFormat& fmt, std::string* err) {
  close();
  fmt_ = fmt;
  if (!open_pcm(&pcm_, device_, SND_PCM_STREAM_PLAYBACK, 0, fmt, err)) return false;
  common::log("audio: playback open on " + device_);
  return true;
}

bool AlsaPlayback::write(std::span<const uint8_t> pcm, std::string* err) {
  if (!pcm_) {
    if (err) *err = "playback not open";
    return false;
  }
  const size_t frameBytes = fmt_.bytesPerFrame();
  size_t off = 0;
  while (pcm.size() - off >= frameBytes) {
    const auto frames = static_cast<snd_pcm_uframes_t>((pcm.size() - off) / frameBytes);
    const snd_pcm_sframes_t wrote = snd_pcm_writei(pcm_, pcm.data() + off, frames);
    if (wrote < 0) {
      const int rc = snd_pcm_recover(pcm_, static_cast<int>(wrote), 1);
      if (rc < 0) {
        if (err) *err = "snd_pcm_writei failed: " + std::string(snd_strerror(static_cast<int>(wrote)));
        return false;
      }
      continue;
    }
    off += static_cast<size_t>(wrote) * frameBytes;
  }
  return true;
}

void AlsaPlayback::close() {
  if (!pcm_) return;
  snd_pcm_drop(pcm_);
  snd_pcm_close(pcm_);
  pcm_ = nullptr;
}

} // namespace audio
