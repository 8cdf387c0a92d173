#include "blankImage.hpp"

#include <png.h>

#include <csetjmp>
#include <string>

using namespace std;

namespace {

void appendToBuffer(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* output_buffer = static_cast<vector<uint8_t>*>(png_get_io_ptr(png_ptr));
    output_buffer->insert(output_buffer->end(), data, data + length);
}

}

expected<vector<uint8_t>, PngError> BlankImage::create(uint32_t width, uint32_t height, array<uint8_t, 3> rgb) {

    if (width == 0 || height == 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        return unexpected(PngError(PngErrorKind::InvalidLength,
            "Image dimensions " + to_string(width) + "x" + to_string(height)
            + " outside 1.." + to_string(MAX_DIMENSION)));
    }

    // Everything libpng touches is built before setjmp so a longjmp skips no destructors
    vector<uint8_t> output;
    vector<uint8_t> row(static_cast<size_t>(width) * 3);
    for (size_t x = 0; x < width; x++) {
        row[x * 3] = rgb[0];
        row[x * 3 + 1] = rgb[1];
        row[x * 3 + 2] = rgb[2];
    }
    vector<png_bytep> row_pointers(height, row.data());

    // Create PNG write structure
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        return unexpected(PngError(PngErrorKind::EncodingFailed, "Failed to create PNG write struct"));
    }

    // Create PNG info structure
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        return unexpected(PngError(PngErrorKind::EncodingFailed, "Failed to create PNG info struct"));
    }

    // Set up error handling
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        return unexpected(PngError(PngErrorKind::EncodingFailed, "libpng failed to encode image"));
    }

    png_set_write_fn(png_ptr, &output, appendToBuffer, nullptr);

    png_set_IHDR(png_ptr, info_ptr, width, height, 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    png_write_info(png_ptr, info_ptr);
    png_write_image(png_ptr, row_pointers.data());
    png_write_end(png_ptr, info_ptr);

    png_destroy_write_struct(&png_ptr, &info_ptr);

    return output;
}
