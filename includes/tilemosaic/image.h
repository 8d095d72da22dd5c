#ifndef TILEMOSAIC_IMAGE_H
#define TILEMOSAIC_IMAGE_H
#pragma once

#include <string>
#include <vector>

namespace tilemosaic {

enum class ImageFormat {
    PNG,
    WEBP,
};

ImageFormat parse_image_format(const std::string &value);
std::string image_media_type(ImageFormat format);

class RGBAImage {
  public:
    RGBAImage();
    // Fully transparent canvas.
    RGBAImage(int width, int height);
    RGBAImage(const unsigned char *data, int size);

    // PNG and JPEG through stb_image, WebP through libwebp.
    void loadFromMemory(const unsigned char *data, int size);

    std::string encodePng() const;
    std::string encodeWebp(float quality = 80.0f) const;

    // Resamples the sub-rectangle [x0, x1) x [y0, y1), in fractional pixels, to the target size.
    RGBAImage resampled(double x0, double y0, double x1, double y1, int target_width, int target_height) const;

    // Copies `source` into this image with its top-left corner at (x, y), clipping at the edges.
    void paste(const RGBAImage &source, int x, int y);

    bool empty() const { return pixels.empty(); }

    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_IMAGE_H
