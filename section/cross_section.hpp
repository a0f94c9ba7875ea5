#ifndef DAMASCUS_SECTION_CROSS_SECTION_HPP
#define DAMASCUS_SECTION_CROSS_SECTION_HPP

#include <billet/billet.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace damascus {

constexpr uint8_t kSectionBackground = 255;

struct SectionParams {
    double slice_position = 0.0;   // Position along the length axis (mm)
    uint32_t resolution = 500;     // Pixels per side
};

// Grey-level image of a slice, row 0 at the top of the billet
struct CrossSection {
    uint32_t width = 0;
    uint32_t height = 0;
    double slice_position = 0.0;
    bool hit = false;              // False when the slice missed the billet
    std::vector<uint8_t> pixels;   // Row-major, width * height

    uint8_t at(uint32_t column, uint32_t row) const {
        return pixels[static_cast<size_t>(row) * width + column];
    }

    // Pixels that are not background
    size_t material_pixels() const;
};

// Slice every layer with the plane y = slice_position and rasterise the
// enclosed regions in the layer's material grey. The billet's current width
// and height extents fill the image. Later layers paint over earlier ones.
//
// A slice outside the billet's current length yields a background-only image.
// Throws Error(InvalidParameter) for a zero resolution.
CrossSection extract_cross_section(const Billet& billet, double slice_position, uint32_t resolution);

CrossSection extract_cross_section(const Billet& billet, const SectionParams& params);

// Binary PGM (P5). Throws Error(IoFailure) when the file can't be written.
void write_pgm(const CrossSection& section, const std::string& path);

}  // namespace damascus

#endif // DAMASCUS_SECTION_CROSS_SECTION_HPP
