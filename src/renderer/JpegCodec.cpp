// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "JpegCodec.hpp"
#include "Errors.hpp"
#include "Logging.hpp"

#include <csetjmp>
#include <cstdio>
#include <string>
#include <string_view>

#include <jpeglib.h>

namespace sig {

namespace {

// libjpeg reports fatal errors through error_exit, which must not return. The handler
// records the message and jumps back to the setjmp in the active JpegDecoder call.
struct JpegErrorHandler {
  jpeg_error_mgr manager;
  std::jmp_buf jumpBuffer;
  char message[JMSG_LENGTH_MAX];
};

[[noreturn]] void handle_jpeg_error(j_common_ptr info) {
  auto* handler = reinterpret_cast<JpegErrorHandler*>(info->err);
  (*info->err->format_message)(info, handler->message);
  std::longjmp(handler->jumpBuffer, 1);
}

void log_jpeg_message(j_common_ptr info) {
  char buffer[JMSG_LENGTH_MAX];
  (*info->err->format_message)(info, buffer);
  Log::d("libjpeg: {}", std::string_view(buffer));
}

// Owns a decompressor reading from memory. Every libjpeg call happens inside a *_guarded
// member whose frame holds nothing with a destructor, so the longjmp out of libjpeg is safe.
class JpegDecoder {
public:
  explicit JpegDecoder(std::span<std::uint8_t const> bytes) {
    mInfo.err = jpeg_std_error(&mError.manager);
    mError.manager.error_exit = handle_jpeg_error;
    mError.manager.output_message = log_jpeg_message;
    mError.message[0] = '\0';
    if (!create_guarded(bytes.data(), bytes.size())) {
      throw failure();
    }
  }

  JpegDecoder(JpegDecoder const&) = delete;
  auto operator=(JpegDecoder const&) -> JpegDecoder& = delete;

  ~JpegDecoder() { jpeg_destroy_decompress(&mInfo); }

  auto read_header() -> Extents {
    if (!read_header_guarded()) {
      throw failure();
    }
    const Extents size{mInfo.image_width, mInfo.image_height};
    if (size.width == 0 || size.height == 0 || size.width > MaxImageDimension ||
        size.height > MaxImageDimension) {
      throw RenderError("decode jpeg", "unsupported image size " + std::to_string(size.width) +
                                           "x" + std::to_string(size.height));
    }
    return size;
  }

  auto read_pixels(Canvas& canvas) -> void {
    if (!read_pixels_guarded(canvas.view().data(), canvas.width(), canvas.height())) {
      throw failure();
    }
  }

  auto warnings() const noexcept -> long { return mError.manager.num_warnings; }

private:
  auto failure() const -> RenderError {
    return RenderError("decode jpeg", mError.message[0] ? mError.message : "unknown error");
  }

  auto create_guarded(std::uint8_t const* data, std::size_t size) -> bool {
    if (setjmp(mError.jumpBuffer)) {
      jpeg_destroy_decompress(&mInfo);
      return false;
    }
    jpeg_create_decompress(&mInfo);
    jpeg_mem_src(&mInfo, data, static_cast<unsigned long>(size));
    return true;
  }

  auto read_header_guarded() -> bool {
    if (setjmp(mError.jumpBuffer)) {
      return false;
    }
    jpeg_read_header(&mInfo, TRUE);
    mInfo.out_color_space = JCS_RGB;
    return true;
  }

  auto read_pixels_guarded(Color* pixels, std::size_t width, std::size_t height) -> bool {
    if (setjmp(mError.jumpBuffer)) {
      return false;
    }
    jpeg_start_decompress(&mInfo);
    if (mInfo.output_width != width || mInfo.output_height != height ||
        mInfo.output_components != 3) {
      std::snprintf(mError.message, sizeof(mError.message), "unexpected output format");
      return false;
    }
    JSAMPARRAY row = (*mInfo.mem->alloc_sarray)(reinterpret_cast<j_common_ptr>(&mInfo),
                                                JPOOL_IMAGE, mInfo.output_width * 3, 1);
    while (mInfo.output_scanline < mInfo.output_height) {
      Color* out = pixels + static_cast<std::size_t>(mInfo.output_scanline) * width;
      jpeg_read_scanlines(&mInfo, row, 1);
      for (JDIMENSION x = 0; x < mInfo.output_width; ++x) {
        out[x] = Color{row[0][3 * x], row[0][3 * x + 1], row[0][3 * x + 2], 255};
      }
    }
    jpeg_finish_decompress(&mInfo);
    return true;
  }

  jpeg_decompress_struct mInfo{};
  JpegErrorHandler mError{};
};

auto check_not_empty(std::span<std::uint8_t const> bytes) -> void {
  if (bytes.empty()) {
    throw RenderError("decode jpeg", "empty input");
  }
}

} // namespace

auto decode_jpeg(std::span<std::uint8_t const> bytes) -> Canvas {
  check_not_empty(bytes);
  JpegDecoder decoder(bytes);
  const Extents size = decoder.read_header();
  Canvas canvas(size.width, size.height);
  decoder.read_pixels(canvas);
  if (decoder.warnings() > 0) {
    Log::d("libjpeg reported {} warnings while decoding", decoder.warnings());
  }
  return canvas;
}

auto read_jpeg_size(std::span<std::uint8_t const> bytes) -> Extents {
  check_not_empty(bytes);
  JpegDecoder decoder(bytes);
  return decoder.read_header();
}

} // namespace sig
