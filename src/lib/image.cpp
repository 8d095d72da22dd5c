#include "tilemosaic/image.h"
#include "tilemosaic/common.h"

#include <webp/decode.h>
#include <webp/encode.h>

#include <algorithm>
#include <cstring>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#define STB_IMAGE_RESIZE2_IMPLEMENTATION
#include "stb_image_resize2.h"

namespace tilemosaic {

namespace {

bool is_webp(const unsigned char *data, int size) {
    return size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0;
}

}  // namespace

ImageFormat parse_image_format(const std::string &value) {
    if (to_lower(trim(value)) == "webp") {
        return ImageFormat::WEBP;
    }
    return ImageFormat::PNG;
}

std::string image_media_type(ImageFormat format) {
    return format == ImageFormat::WEBP ? "image/webp" : "image/png";
}

RGBAImage::RGBAImage() {

}

RGBAImage::RGBAImage(int width, int height)
    : width(width), height(height), pixels(static_cast<std::size_t>(width) * height * 4, 0) {}

RGBAImage::RGBAImage(const unsigned char *data, int size) {
    loadFromMemory(data, size);
}

void RGBAImage::loadFromMemory(const unsigned char *data, int size) {
    if (data == nullptr || size <= 0) {
        throw malformed_input_error("Tile image data is empty");
    }

    if (is_webp(data, size)) {
        int w = 0;
        int h = 0;
        uint8_t *raw = WebPDecodeRGBA(data, static_cast<size_t>(size), &w, &h);
        if (raw == nullptr) {
            throw malformed_input_error("Failed to decode WebP image");
        }
        this->width = w;
        this->height = h;
        this->pixels.assign(raw, raw + static_cast<std::size_t>(w) * h * 4);
        WebPFree(raw);
        return;
    }

    int components = 0;
    unsigned char *raw = stbi_load_from_memory(data, size, &this->width, &this->height, &components, 4);
    if (raw == nullptr) {
        throw malformed_input_error(std::string("Failed to decode image: ") + stbi_failure_reason());
    }
    this->pixels.assign(raw, raw + static_cast<std::size_t>(this->width) * this->height * 4);
    stbi_image_free(raw);
}

std::string RGBAImage::encodePng() const {
    std::string buffer;
    buffer.reserve(static_cast<std::size_t>(this->width) * this->height);

    auto callback = [](void *context, void *data_ptr, int size) {
        auto *destination = static_cast<std::string *>(context);
        destination->append(static_cast<const char *>(data_ptr), static_cast<std::size_t>(size));
    };

    if (stbi_write_png_to_func(callback, &buffer, this->width, this->height, 4, this->pixels.data(),
                               this->width * 4) == 0) {
        throw unknown_error("Failed to encode tile as PNG");
    }
    return buffer;
}

std::string RGBAImage::encodeWebp(float quality) const {
    uint8_t *output = nullptr;
    const size_t size = WebPEncodeRGBA(this->pixels.data(), this->width, this->height, this->width * 4,
                                       quality, &output);
    if (size == 0 || output == nullptr) {
        throw unknown_error("Failed to encode tile as WebP");
    }
    std::string buffer(reinterpret_cast<const char *>(output), size);
    WebPFree(output);
    return buffer;
}

RGBAImage RGBAImage::resampled(double x0, double y0, double x1, double y1, int target_width,
                               int target_height) const {
    RGBAImage result(std::max(target_width, 0), std::max(target_height, 0));
    if (empty() || target_width <= 0 || target_height <= 0 || x1 <= x0 || y1 <= y0) {
        return result;
    }

    STBIR_RESIZE resize;
    stbir_resize_init(&resize, pixels.data(), width, height, width * 4, result.pixels.data(), target_width,
                      target_height, target_width * 4, STBIR_RGBA, STBIR_TYPE_UINT8);
    if (!stbir_set_input_subrect(&resize, x0 / width, y0 / height, x1 / width, y1 / height) ||
        !stbir_resize_extended(&resize)) {
        throw unknown_error("Failed to resample image to " + std::to_string(target_width) + "x" +
                            std::to_string(target_height));
    }
    return result;
}

void RGBAImage::paste(const RGBAImage &source, int x, int y) {
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(width, x + source.width);
    const int y1 = std::min(height, y + source.height);
    if (x0 >= x1 || y0 >= y1) {
        return;
    }
    const std::size_t row_bytes = static_cast<std::size_t>(x1 - x0) * 4;
    for (int row = y0; row < y1; ++row) {
        const std::size_t src = (static_cast<std::size_t>(row - y) * source.width + (x0 - x)) * 4;
        const std::size_t dst = (static_cast<std::size_t>(row) * width + x0) * 4;
        std::memcpy(&pixels[dst], &source.pixels[src], row_bytes);
    }
}

}  // namespace tilemosaic
