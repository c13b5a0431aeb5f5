// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "png_writer.h"

#include "raster.h"

#include <cstdio>
#include <png.h>
#include <stdexcept>
#include <vector>

namespace seedtrack {

auto writePng(const std::string& filename, const Image& image) -> void
{
    // Everything that must survive a longjmp from libpng is set up
    // before setjmp.
    std::vector<png_const_bytep> rows(image.height);
    for (int i {}; i < image.height; ++i) {
        rows[i] = &image.rgba(i, 0);
    }
    FILE* fp { std::fopen(filename.c_str(), "wb") };
    if (fp == nullptr) {
        throw std::runtime_error { "could not open " + filename
                                   + " for writing" };
    }
    png_structp png { png_create_write_struct(
      PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr) };
    png_infop info { png == nullptr ? nullptr : png_create_info_struct(png) };
    if (png == nullptr || info == nullptr) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        throw std::runtime_error { "could not initialize PNG writer for "
                                   + filename };
    }
    // NOLINTNEXTLINE(cert-err52-cpp)
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        throw std::runtime_error { "error while writing " + filename };
    }
    png_init_io(png, fp);
    png_set_IHDR(png,
                 info,
                 static_cast<png_uint_32>(image.width),
                 static_cast<png_uint_32>(image.height),
                 8,
                 PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    png_write_image(png, const_cast<png_bytepp>(rows.data()));
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0) {
        throw std::runtime_error { "could not close " + filename };
    }
}

} // namespace seedtrack
