#include "vcast/encoder.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstdlib>

#include <jpeglib.h>

namespace vcast {

namespace {

// libjpeg's default error_exit() terminates the process; jump back instead.
struct JpegErrorMgr {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit_jump(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void jpeg_output_message_quiet(j_common_ptr) {}

} // namespace

bool JpegEncoder::encode(const RawImage& img, int quality, std::string& out) {
    if (!img.valid()) {
        last_error_ = "invalid image";
        return false;
    }
    if (quality < 1) quality = 1;
    if (quality > 100) quality = 100;

    jpeg_compress_struct cinfo;
    JpegErrorMgr jerr;
    jerr.message[0] = '\0';
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_jump;
    jerr.pub.output_message = jpeg_output_message_quiet;

    unsigned char* mem = nullptr;
    unsigned long mem_size = 0;

    if (setjmp(jerr.jump)) {
        jpeg_destroy_compress(&cinfo);
        if (mem) std::free(mem);
        last_error_ = jerr.message;
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &mem, &mem_size);

    cinfo.image_width = (JDIMENSION)img.width;
    cinfo.image_height = (JDIMENSION)img.height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    const std::size_t stride = (std::size_t)img.width * 3;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(img.rgb.data() + cinfo.next_scanline * stride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    out.assign(reinterpret_cast<const char*>(mem), mem_size);
    std::free(mem);
    last_error_.clear();
    return true;
}

} // namespace vcast
