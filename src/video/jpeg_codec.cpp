#include "src/video/jpeg_codec.h"

#include "common/util.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <algorithm>
#include <cstring>

namespace video {

namespace {

constexpr uint32_t make_fourcc(char a, char b, char c, char d) {
  return static_cast<uint32_t>(static_cast<unsigned char>(a)) |
         (static_cast<uint32_t>(static_cast<unsigned char>(b)) << 8) |
         (static_cast<uint32_t>(static_cast<unsigned char>(c)) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(d)) << 24);
}

std::string ffmpeg_err_string(int rc) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {};
  av_strerror(rc, buf, sizeof(buf));
  return buf;
}

class ScopedFrame {
public:
  ScopedFrame() : f(av_frame_alloc()) {}
  ~ScopedFrame() { av_frame_free(&f); }
  AVFrame* get() const { return f; }

private:
  AVFrame* f = nullptr;
};

AVPixelFormat fourcc_to_pixfmt(uint32_t fourcc) {
  if (fourcc == make_fourcc('Y', 'U', 'Y', 'V')) return AV_PIX_FMT_YUYV422;
  if (fourcc == make_fourcc('Y', 'V', 'Y', 'U')) return AV_PIX_FMT_YVYU422;
  if (fourcc == make_fourcc('U', 'Y', 'V', 'Y')) return AV_PIX_FMT_UYVY422;
  if (fourcc == make_fourcc('N', 'V', '1', '2')) return AV_PIX_FMT_NV12;
  if (fourcc == make_fourcc('N', 'V', '2', '1')) return AV_PIX_FMT_NV21;
  if (fourcc == make_fourcc('Y', 'U', '1', '2')) return AV_PIX_FMT_YUV420P;
  if (fourcc == make_fourcc('Y', 'V', '1', '2')) return AV_PIX_FMT_YUV420P;
  if (fourcc == make_fourcc('R', 'G', 'B', '3')) return AV_PIX_FMT_RGB24;
  if (fourcc == make_fourcc('B', 'G', 'R', '3')) return AV_PIX_FMT_BGR24;
  if (fourcc == make_fourcc('G', 'R', 'E', 'Y')) return AV_PIX_FMT_GRAY8;
  return AV_PIX_FMT_NONE;
}

bool is_mjpeg_fourcc(uint32_t fourcc) {
  return fourcc == make_fourcc('M', 'J', 'P', 'G') || fourcc == make_fourcc('J', 'P', 'E', 'G');
}

bool scale_to_rgb(const AVFrame* src, int width, int height, Image* out, std::string* err) {
  if (src->width <= 0 || src->height <= 0 || width <= 0 || height <= 0) {
    if (err) *err = "invalid frame geometry";
    return false;
  }
  SwsContext* sws = sws_getContext(src->width, src->height, static_cast<AVPixelFormat>(src->format),
                                   width, height, AV_PIX_FMT_RGB24, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws) {
    if (err) *err = "sws_getContext failed";
    return false;
  }
  out->width = width;
  out->height = height;
  out->rgb.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
  uint8_t* dst_data[4] = {out->rgb.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {width * 3, 0, 0, 0};
  sws_scale(sws, src->data, src->linesize, 0, src->height, dst_data, dst_linesize);
  sws_freeContext(sws);
  return true;
}

// One MJPEG decode into `frame`; shared by capture conversion and the
// network decoder.
bool decode_mjpeg(AVCodecContext* ctx, AVPacket* pkt, AVFrame* frame, const uint8_t* data, size_t len,
                  std::string* err) {
  av_packet_unref(pkt);
  pkt->data = const_cast<uint8_t*>(data);
  pkt->size = static_cast<int>(len);
  int rc = avcodec_send_packet(ctx, pkt);
  if (rc < 0) {
    if (err) *err = "avcodec_send_packet failed: " + ffmpeg_err_string(rc);
    avcodec_flush_buffers(ctx);
    return false;
  }
  av_frame_unref(frame);
  rc = avcodec_receive_frame(ctx, frame);
  if (rc < 0) {
    if (err) *err = "avcodec_receive_frame failed: " + ffmpeg_err_string(rc);
    avcodec_flush_buffers(ctx);
    return false;
  }
  return true;
}

AVCodecContext* open_mjpeg_decoder(std::string* err) {
  const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_MJPEG);
  if (!codec) {
    if (err) *err = "mjpeg decoder not found";
    return nullptr;
  }
  AVCodecContext* ctx = avcodec_alloc_context3(codec);
  if (!ctx) {
    if (err) *err = "avcodec_alloc_context3 failed";
    return nullptr;
  }
  ctx->thread_count = 1;
  const int rc = avcodec_open2(ctx, codec, nullptr);
  if (rc < 0) {
    if (err) *err = "avcodec_open2 failed: " + ffmpeg_err_string(rc);
    avcodec_free_context(&ctx);
    return nullptr;
  }
  return ctx;
}

bool raw_to_rgb_sws(const RawFrame& in, int width, int height, Image* out, std::string* err) {
  const AVPixelFormat srcFmt = fourcc_to_pixfmt(in.fourcc);
  if (srcFmt == AV_PIX_FMT_NONE) {
    if (err) *err = "unsupported raw fourcc";
    return false;
  }
  if (in.bytes.empty()) {
    if (err) *err = "empty raw frame";
    return false;
  }
  ScopedFrame src;
  if (!src.get()) {
    if (err) *err = "av_frame_alloc failed";
    return false;
  }
  src.get()->format = srcFmt;
  src.get()->width = static_cast<int>(in.width);
  src.get()->height = static_cast<int>(in.height);
  const int need = av_image_fill_arrays(src.get()->data, src.get()->linesize, in.bytes.data(), srcFmt,
                                        src.get()->width, src.get()->height, 1);
  if (need < 0) {
    if (err) *err = "av_image_fill_arrays failed";
    return false;
  }
  if (static_cast<size_t>(need) > in.bytes.size()) {
    if (err) *err = "short raw frame";
    return false;
  }
  if (in.fourcc == make_fourcc('Y', 'V', '1', '2')) {
    std::swap(src.get()->data[1], src.get()->data[2]);
    std::swap(src.get()->linesize[1], src.get()->linesize[2]);
  }
  return scale_to_rgb(src.get(), width, height, out, err);
}

} // namespace

bool isInputFourccSupported(uint32_t fourcc) {
  return is_mjpeg_fourcc(fourcc) || fourcc_to_pixfmt(fourcc) != AV_PIX_FMT_NONE;
}

bool rawFrameToImage(const RawFrame& in, int width, int height, Image* out, std::string* err) {
  if (!out) return false;
  if (!is_mjpeg_fourcc(in.fourcc)) return raw_to_rgb_sws(in, width, height, out, err);

  // Per-thread decoder for cameras that deliver MJPEG.
  static thread_local AVCodecContext* ctx = nullptr;
  static thread_local AVPacket* pkt = av_packet_alloc();
  static thread_local AVFrame* frame = av_frame_alloc();
  if (!pkt || !frame) {
    if (err) *err = "decoder buffers unavailable";
    return false;
  }
  if (!ctx) {
    ctx = open_mjpeg_decoder(err);
    if (!ctx) return false;
  }
  if (!decode_mjpeg(ctx, pkt, frame, in.bytes.data(), in.bytes.size(), err)) return false;
  const bool ok = scale_to_rgb(frame, width, height, out, err);
  av_frame_unref(frame);
  return ok;
}

struct JpegEncoder::Impl {
  AVCodecContext* ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* pkt = nullptr;
  SwsContext* sws = nullptr;
  int srcWidth = 0;
  int srcHeight = 0;
  int qscale = 2;
  int64_t nextPts = 0;
};

JpegEncoder::JpegEncoder() : impl_(std::make_unique<Impl>()) {}
JpegEncoder::~JpegEncoder() { close(); }

bool JpegEncoder::open(const JpegParams& p, std::string* err) {
  close();
  impl_ = std::make_unique<Impl>();
  if (p.width <= 0 || p.height <= 0 || p.fps <= 0) {
    if (err) *err = "invalid encoder geometry";
    return false;
  }

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec) {
    if (err) *err = "mjpeg encoder not found";
    return false;
  }
  impl_->ctx = avcodec_alloc_context3(codec);
  if (!impl_->ctx) {
    if (err) *err = "avcodec_alloc_context3 failed";
    return false;
  }
  impl_->ctx->width = p.width;
  impl_->ctx->height = p.height;
  impl_->ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
  impl_->ctx->color_range = AVCOL_RANGE_JPEG;
  impl_->ctx->time_base = AVRational{1, p.fps};
  impl_->ctx->flags |= AV_CODEC_FLAG_QSCALE;
  impl_->ctx->thread_count = 1;

  // Map 1..100 quality onto the MJPEG qscale range 31..2.
  const int quality = std::clamp(p.quality, 1, 100);
  impl_->qscale = 2 + ((100 - quality) * 29) / 99;
  impl_->ctx->global_quality = FF_QP2LAMBDA * impl_->qscale;

  const int rc = avcodec_open2(impl_->ctx, codec, nullptr);
  if (rc < 0) {
    if (err) *err = "avcodec_open2 failed: " + ffmpeg_err_string(rc);
    close();
    return false;
  }

  impl_->frame = av_frame_alloc();
  impl_->pkt = av_packet_alloc();
  if (!impl_->frame || !impl_->pkt) {
    if (err) *err = "alloc frame/packet failed";
    close();
    return false;
  }
  impl_->frame->format = impl_->ctx->pix_fmt;
  impl_->frame->width = p.width;
  impl_->frame->height = p.height;
  if (av_frame_get_buffer(impl_->frame, 32) < 0) {
    if (err) *err = "av_frame_get_buffer failed";
    close();
    return false;
  }
  common::log("video: jpeg encoder open " + std::to_string(p.width) + "x" + std::to_string(p.height) +
              " quality=" + std::to_string(quality));
  return true;
}

void JpegEncoder::close() {
  if (!impl_) return;
  if (impl_->sws) sws_freeContext(impl_->sws);
  if (impl_->pkt) av_packet_free(&impl_->pkt);
  if (impl_->frame) av_frame_free(&impl_->frame);
  if (impl_->ctx) avcodec_free_context(&impl_->ctx);
  impl_.reset();
}

bool JpegEncoder::isOpen() const { return impl_ && impl_->ctx && impl_->frame && impl_->pkt; }

bool JpegEncoder::encode(const Image& in, std::vector<uint8_t>* out, std::string* err) {
  if (!out) return false;
  if (!isOpen()) {
    if (err) *err = "encoder not open";
    return false;
  }
  if (in.empty() || in.rgb.size() < static_cast<size_t>(in.width) * static_cast<size_t>(in.height) * 3) {
    if (err) *err = "empty image";
    return false;
  }

  if (!impl_->sws || impl_->srcWidth != in.width || impl_->srcHeight != in.height) {
    if (impl_->sws) sws_freeContext(impl_->sws);
    impl_->sws = sws_getContext(in.width, in.height, AV_PIX_FMT_RGB24, impl_->ctx->width, impl_->ctx->height,
                                AV_PIX_FMT_YUVJ420P, SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!impl_->sws) {
      if (err) *err = "sws_getContext failed";
      return false;
    }
    impl_->srcWidth = in.width;
    impl_->srcHeight = in.height;
  }

  if (av_frame_make_writable(impl_->frame) < 0) {
    if (err) *err = "av_frame_make_writable failed";
    return false;
  }
  const uint8_t* src_data[4] = {in.rgb.data(), nullptr, nullptr, nullptr};
  const int src_linesize[4] = {in.width * 3, 0, 0, 0};
  sws_scale(impl_->sws, src_data, src_linesize, 0, in.height, impl_->frame->data, impl_->frame->linesize);
  impl_->frame->pts = impl_->nextPts++;
  impl_->frame->quality = impl_->ctx->global_quality;

  int rc = avcodec_send_frame(impl_->ctx, impl_->frame);
  if (rc < 0) {
    if (err) *err = "avcodec_send_frame failed: " + ffmpeg_err_string(rc);
    return false;
  }
  av_packet_unref(impl_->pkt);
  rc = avcodec_receive_packet(impl_->ctx, impl_->pkt);
  if (rc < 0) {
    if (err) *err = "avcodec_receive_packet failed: " + ffmpeg_err_string(rc);
    return false;
  }
  out->assign(impl_->pkt->data, impl_->pkt->data + impl_->pkt->size);
  av_packet_unref(impl_->pkt);
  return true;
}

struct JpegDecoder::Impl {
  AVCodecContext* ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* pkt = nullptr;
};

JpegDecoder::JpegDecoder() : impl_(std::make_unique<Impl>()) {}
JpegDecoder::~JpegDecoder() { close(); }

bool JpegDecoder::open(std::string* err) {
  close();
  impl_ = std::make_unique<Impl>();
  impl_->ctx = open_mjpeg_decoder(err);
  if (!impl_->ctx) {
    close();
    return false;
  }
  impl_->frame = av_frame_alloc();
  impl_->pkt = av_packet_alloc();
  if (!impl_->frame || !impl_->pkt) {
    if (err) *err = "alloc frame/packet failed";
    close();
    return false;
  }
  return true;
}

void JpegDecoder::close() {
  if (!impl_) return;
  if (impl_->pkt) av_packet_free(&impl_->pkt);
  if (impl_->frame) av_frame_free(&impl_->frame);
  if (impl_->ctx) avcodec_free_context(&impl_->ctx);
  impl_.reset();
}

bool JpegDecoder::isOpen() const { return impl_ && impl_->ctx && impl_->frame && impl_->pkt; }

bool JpegDecoder::decode(const uint8_t* data, size_t len, Image* out, std::string* err) {
  if (!out) return false;
  if (!isOpen()) {
    if (err) *err = "decoder not open";
    return false;
  }
  if (!data || len == 0) {
    if (err) *err = "empty input";
    return false;
  }
  if (!decode_mjpeg(impl_->ctx, impl_->pkt, impl_->frame, data, len, err)) return false;
  const bool ok = scale_to_rgb(impl_->frame, impl_->frame->width, impl_->frame->height, out, err);
  av_frame_unref(impl_->frame);
  return ok;
}

} // namespace video
