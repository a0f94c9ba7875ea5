#include "cross_section.hpp"
#include "logging.hpp"
#include <common/error.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>

namespace damascus {

namespace {

// Slice segment in the width/height plane
struct Segment {
    double x0, z0;
    double x1, z1;
};

// Maps world width/height onto pixel columns/rows. Pixel centres sit at
// half-pixel offsets; row 0 is the top of the billet.
struct PixelMap {
    double x_min;
    double z_max;
    double x_step;
    double z_step;

    double column_center(uint32_t column) const { return x_min + (column + 0.5) * x_step; }
    double row_center(uint32_t row) const { return z_max - (row + 0.5) * z_step; }

    long column_of(double x) const {
        return static_cast<long>(std::floor((x - x_min) / x_step));
    }
    long row_of(double z) const {
        return static_cast<long>(std::floor((z_max - z) / z_step));
    }
};

std::vector<Segment> slice_layer(const Vertices& vertices, const Topology& triangles, double y) {
    std::vector<Segment> segments;
    for (const auto& tri : triangles) {
        auto hit = intersect_plane(vertices[tri.a], vertices[tri.b], vertices[tri.c], Axis::Y, y);
        if (hit) {
            segments.push_back({hit->first.x, hit->first.z, hit->second.x, hit->second.z});
        }
    }
    return segments;
}

void fill_layer(CrossSection& image, const PixelMap& map,
                const std::vector<Segment>& segments, uint8_t gray) {
    std::vector<double> crossings;

    // Even-odd scanline fill, half-open in z so shared endpoints count once
    for (uint32_t row = 0; row < image.height; ++row) {
        double zc = map.row_center(row);
        crossings.clear();
        for (const auto& s : segments) {
            double lo = std::min(s.z0, s.z1);
            double hi = std::max(s.z0, s.z1);
            if (zc < lo || zc >= hi) continue;
            double t = (zc - s.z0) / (s.z1 - s.z0);
            crossings.push_back(s.x0 + t * (s.x1 - s.x0));
        }
        std::sort(crossings.begin(), crossings.end());

        for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
            long first = std::max(0L, static_cast<long>(std::ceil((crossings[k] - map.x_min) / map.x_step - 0.5)));
            long last = std::min(static_cast<long>(image.width) - 1,
                                 static_cast<long>(std::ceil((crossings[k + 1] - map.x_min) / map.x_step - 0.5)) - 1);
            for (long column = first; column <= last; ++column) {
                image.pixels[static_cast<size_t>(row) * image.width + column] = gray;
            }
        }
    }

    // Outline, so layers thinner than a pixel still show
    for (const auto& s : segments) {
        double dc = (s.x1 - s.x0) / map.x_step;
        double dr = (s.z0 - s.z1) / map.z_step;
        int steps = static_cast<int>(std::ceil(std::max(std::abs(dc), std::abs(dr)))) + 1;
        for (int k = 0; k <= steps; ++k) {
            double t = static_cast<double>(k) / steps;
            long column = map.column_of(s.x0 + t * (s.x1 - s.x0));
            long row = map.row_of(s.z0 + t * (s.z1 - s.z0));
            column = std::clamp(column, 0L, static_cast<long>(image.width) - 1);
            row = std::clamp(row, 0L, static_cast<long>(image.height) - 1);
            image.pixels[static_cast<size_t>(row) * image.width + column] = gray;
        }
    }
}

}  // namespace

size_t CrossSection::material_pixels() const {
    return static_cast<size_t>(std::count_if(pixels.begin(), pixels.end(),
                                              [](uint8_t p) { return p != kSectionBackground; }));
}

CrossSection extract_cross_section(const Billet& billet, double slice_position, uint32_t resolution) {
    auto log = damascus::logging::get_logger();

    if (resolution == 0) {
        throw Error(ErrorCode::InvalidParameter, "cross-section resolution must be at least 1");
    }

    CrossSection image;
    image.width = resolution;
    image.height = resolution;
    image.slice_position = slice_position;
    image.pixels.assign(static_cast<size_t>(resolution) * resolution, kSectionBackground);

    // Pin every layer's vertex array for the duration of the read
    const auto& layers = billet.layers();
    std::vector<std::shared_ptr<const Vertices>> snapshots;
    snapshots.reserve(layers.size());
    Bounds bounds;
    for (const auto& layer : layers) {
        snapshots.push_back(layer.vertex_snapshot());
        bounds.expand(compute_bounds(*snapshots.back()));
    }

    if (bounds.empty || !std::isfinite(slice_position) ||
        slice_position < bounds.min.y || slice_position > bounds.max.y) {
        log->debug("Slice at {:.2f}mm misses the billet, background only", slice_position);
        return image;
    }

    Vec3 extent = bounds.size();
    if (!(extent.x > 0.0) || !(extent.z > 0.0)) {
        return image;
    }

    PixelMap map{
        .x_min = bounds.min.x,
        .z_max = bounds.max.z,
        .x_step = extent.x / resolution,
        .z_step = extent.z / resolution
    };

    std::vector<std::vector<Segment>> segments(layers.size());

    #pragma omp parallel for schedule(static) if(layers.size() > 8)
    for (size_t i = 0; i < layers.size(); ++i) {
        segments[i] = slice_layer(*snapshots[i], layers[i].triangles(), slice_position);
    }

    size_t segment_count = 0;
    for (size_t i = 0; i < layers.size(); ++i) {
        if (segments[i].empty()) continue;
        image.hit = true;
        segment_count += segments[i].size();
        fill_layer(image, map, segments[i], layers[i].material().gray_level());
    }

    log->debug("Slice at {:.2f}mm: {} segments, {} material pixels",
               slice_position, segment_count, image.material_pixels());
    return image;
}

CrossSection extract_cross_section(const Billet& billet, const SectionParams& params) {
    return extract_cross_section(billet, params.slice_position, params.resolution);
}

void write_pgm(const CrossSection& section, const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw Error(ErrorCode::IoFailure, "failed to open file for writing: " + path);
    }
    file << "P5\n" << section.width << " " << section.height << "\n255\n";
    file.write(reinterpret_cast<const char*>(section.pixels.data()),
               static_cast<std::streamsize>(section.pixels.size()));
    if (!file) {
        throw Error(ErrorCode::IoFailure, "failed to write cross-section: " + path);
    }

    auto log = damascus::logging::get_logger();
    log->info("Wrote {}x{} cross-section to {}", section.width, section.height, path);
}

}  // namespace damascus
