#include "green_coverage/raster_source.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace green_coverage {

PixelBlockStream::PixelBlockStream(RasterSource& raster, PixelWindow window, int red_band, int nir_band, int tile_rows)
    : raster_(raster),
      window_(window),
      red_band_(red_band),
      nir_band_(nir_band),
      tile_rows_(tile_rows),
      next_row_(window.row_offset) {
    if (tile_rows_ <= 0) {
        throw std::invalid_argument("tile_rows must be positive");
    }
}

std::optional<PixelBlock> PixelBlockStream::next() {
    const int end_row = window_.row_offset + window_.height;
    if (window_.empty() || next_row_ >= end_row) {
        return std::nullopt;
    }
    PixelBlock block{};
    block.window = PixelWindow{window_.col_offset, next_row_, window_.width, std::min(tile_rows_, end_row - next_row_)};
    raster_.read_window(red_band_, block.window, block.red);
    raster_.read_window(nir_band_, block.window, block.nir);
    next_row_ += block.window.height;
    return block;
}

}  // namespace green_coverage
