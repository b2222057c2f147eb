// Shared xterm-256 palette implementation.
//
// The palette layout matches the widely-used xterm-256 definition:
// - 0..15   : ANSI base colors
// - 16..231 : 6x6x6 color cube (levels: 0,95,135,175,215,255)
// - 232..255: grayscale ramp (24 steps, 8..238)
//
// NearestIndex() is an exhaustive scan in index order so that equal distances
// always resolve to the lowest index (e.g. black maps to 0, not 16).

#include "core/xterm256_palette.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace xterm256
{
namespace
{
constexpr std::array<Rgb, 256> BuildPalette()
{
    std::array<Rgb, 256> p{};

    auto set = [&](int idx, int r, int g, int b) {
        p[(size_t)idx] = Rgb{(std::uint8_t)r, (std::uint8_t)g, (std::uint8_t)b};
    };

    // 0–15: standard ANSI colors (common xterm defaults)
    set(0, 0, 0, 0);
    set(1, 205, 0, 0);
    set(2, 0, 205, 0);
    set(3, 205, 205, 0);
    set(4, 0, 0, 238);
    set(5, 205, 0, 205);
    set(6, 0, 205, 205);
    set(7, 229, 229, 229);
    set(8, 127, 127, 127);
    set(9, 255, 0, 0);
    set(10, 0, 255, 0);
    set(11, 255, 255, 0);
    set(12, 92, 92, 255);
    set(13, 255, 0, 255);
    set(14, 0, 255, 255);
    set(15, 255, 255, 255);

    // 16–231: 6x6x6 color cube
    constexpr int level[6] = {0, 95, 135, 175, 215, 255};
    for (int i = 16; i <= 231; ++i)
    {
        int idx = i - 16;
        int rr = idx / 36;
        int gg = (idx % 36) / 6;
        int bb = idx % 6;
        set(i, level[rr], level[gg], level[bb]);
    }

    // 232–255: grayscale ramp
    for (int i = 232; i <= 255; ++i)
    {
        int shade = 8 + (i - 232) * 10;
        set(i, shade, shade, shade);
    }

    return p;
}

constexpr std::array<Rgb, 256> kPalette = BuildPalette();

static inline int Dist2(std::uint8_t r0, std::uint8_t g0, std::uint8_t b0,
                        std::uint8_t r1, std::uint8_t g1, std::uint8_t b1)
{
    const int dr = (int)r0 - (int)r1;
    const int dg = (int)g0 - (int)g1;
    const int db = (int)b0 - (int)b1;
    return dr * dr + dg * dg + db * db;
}

static int NearestInRange(std::uint8_t r, std::uint8_t g, std::uint8_t b, int count)
{
    int best = 0;
    int best_d2 = 0x7fffffff;
    for (int i = 0; i < count; ++i)
    {
        const Rgb& p = kPalette[(size_t)i];
        const int d2 = Dist2(r, g, b, p.r, p.g, p.b);
        if (d2 < best_d2)
        {
            best_d2 = d2;
            best = i;
        }
    }
    return best;
}
} // namespace

const Rgb& RgbForIndex(int idx)
{
    const std::uint8_t i = ClampIndex(idx);
    return kPalette[(size_t)i];
}

int NearestIndex(std::uint8_t r, std::uint8_t g, std::uint8_t b)
{
    return NearestInRange(r, g, b, 256);
}

int NearestIndex16(std::uint8_t r, std::uint8_t g, std::uint8_t b)
{
    return NearestInRange(r, g, b, 16);
}
} // namespace xterm256
