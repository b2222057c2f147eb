// Shared xterm-256 palette utilities (single source of truth).
// This is the built-in palette used as:
//   - the quantization target for 256-color and 16-color ANSI export
//   - the conversion table for legacy numeric colors found in older project files
//   - the source of the curated default palette
//
// Colors are RGB only; the in-memory cell model never stores indices.
#pragma once

#include <cstdint>

namespace xterm256
{
struct Rgb
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

// Returns the palette RGB for idx (0..255). Out-of-range indices are clamped.
const Rgb& RgbForIndex(int idx);

// Finds the nearest xterm-256 index to the given RGB by scanning all 256 entries.
// Squared Euclidean distance; ties resolve to the lowest index.
int NearestIndex(std::uint8_t r, std::uint8_t g, std::uint8_t b);

// Same as NearestIndex() restricted to the 16 standard ANSI entries (0..15).
int NearestIndex16(std::uint8_t r, std::uint8_t g, std::uint8_t b);

// Helpers
inline std::uint8_t ClampIndex(int idx)
{
    if (idx < 0) return 0;
    if (idx > 255) return 255;
    return (std::uint8_t)idx;
}
} // namespace xterm256
