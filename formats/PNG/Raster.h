#pragma once

#include <cstdint>
#include <vector>

namespace FRLGRender {

constexpr uint32_t kOpaqueBlack = 0xFF000000;

inline uint32_t makeARGB(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
           (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(b);
}

// Row-major ARGB pixels, the same layout the PNG helpers read and write.
struct Raster {
    int width = 0;
    int height = 0;
    std::vector<uint32_t> pixels;

    Raster() = default;
    Raster(int width, int height, uint32_t fill = kOpaqueBlack)
        : width(width), height(height),
          pixels(static_cast<size_t>(width) * static_cast<size_t>(height), fill) {}

    uint32_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    void set(int x, int y, uint32_t argb) { pixels[static_cast<size_t>(y) * width + x] = argb; }

    // Copies src with its top-left corner at (left, top); parts outside this raster are dropped.
    void blit(const Raster& src, int left, int top) {
        for (int y = 0; y < src.height; ++y) {
            int dy = top + y;
            if (dy < 0 || dy >= height) {
                continue;
            }
            for (int x = 0; x < src.width; ++x) {
                int dx = left + x;
                if (dx < 0 || dx >= width) {
                    continue;
                }
                set(dx, dy, src.at(x, y));
            }
        }
    }

    bool operator==(const Raster& other) const {
        return width == other.width && height == other.height && pixels == other.pixels;
    }
};

} // namespace FRLGRender
