#ifndef BLANK_IMAGE_HPP
#define BLANK_IMAGE_HPP

#include <array>
#include <cstdint>
#include <expected>
#include <vector>

#include "Utility/pngError.hpp"

/**
 * @brief Produces small solid-colour PNG files with libpng.
 *
 * Used by the demo command to get a real carrier image without any input
 * file, and by the tests as a fixture source.
 */
class BlankImage {
public:
    static constexpr uint32_t MAX_DIMENSION = 4096;

    /**
     * @brief Encode a width x height 8-bit RGB image filled with one colour.
     *
     * @return Complete PNG file bytes, InvalidLength for a zero or oversized
     *         dimension, EncodingFailed if libpng reports an error
     */
    static std::expected<std::vector<uint8_t>, PngError> create(
        uint32_t width, uint32_t height, std::array<uint8_t, 3> rgb = {0xFF, 0xFF, 0xFF});

private:
    BlankImage() = delete;
};

#endif
