// === Raster Source ===========================================================
//
// Read-only access to a multi-band raster by window, plus the lazy row-strip
// stream the analyzer uses so that a clip never has to be materialized whole.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "green_coverage/spatial_reference.hpp"
#include "green_coverage/types.hpp"

namespace green_coverage {

/**
 * @brief Abstract multi-band raster. Band indices are zero-based.
 */
class RasterSource {
  public:
    virtual ~RasterSource() = default;

    /** @brief Human-readable origin (usually the file path). */
    [[nodiscard]] virtual const std::string& description() const noexcept = 0;
    [[nodiscard]] virtual const CrsDescriptor& crs() const noexcept = 0;
    [[nodiscard]] virtual const GeoTransform& geotransform() const noexcept = 0;
    [[nodiscard]] virtual int width() const noexcept = 0;
    [[nodiscard]] virtual int height() const noexcept = 0;
    [[nodiscard]] virtual int band_count() const noexcept = 0;
    /** @brief Nodata sentinel declared for a band, if any. */
    [[nodiscard]] virtual std::optional<double> nodata(int band) const = 0;

    /**
     * @brief Read `window` of `band` in row-major order into `buffer`.
     *
     * The buffer is resized to `window.cell_count()`. Throws `CoverageError`
     * when the read fails.
     */
    virtual void read_window(int band, const PixelWindow& window, std::vector<double>& buffer) = 0;
};

using RasterSourcePtr = std::unique_ptr<RasterSource>;

/**
 * @brief Red and NIR samples of one row strip.
 */
struct PixelBlock final {
    PixelWindow window{};
    std::vector<double> red{};
    std::vector<double> nir{};
};

/**
 * @brief Finite, non-restartable sequence of row strips covering a window.
 */
class PixelBlockStream final {
  public:
    PixelBlockStream(RasterSource& raster, PixelWindow window, int red_band, int nir_band, int tile_rows);

    /** @brief Next strip, or empty once the window is exhausted. */
    std::optional<PixelBlock> next();

  private:
    RasterSource& raster_;
    PixelWindow window_;
    int red_band_;
    int nir_band_;
    int tile_rows_;
    int next_row_;
};

}  // namespace green_coverage
