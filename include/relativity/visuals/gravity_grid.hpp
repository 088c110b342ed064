/**
 * @file gravity_grid.hpp
 * @brief Screen-space grid warped toward massive bodies
 *
 * The grid spans the screen with GridColumns x GridRows cells. Each vertex
 * is pulled along the local field direction by
 *   min(ln(1 + |g| / ref) * scale, maxDisplacement, fraction * nearestMassPixels)
 * after which every row and column is swept forward then backward so
 * neighbouring vertices stay at least GridMinSpacingPixels apart. Lines
 * therefore never cross or fold.
 */

#ifndef RELATIVITY_GRAVITY_GRID_HPP
#define RELATIVITY_GRAVITY_GRID_HPP

#include <cstddef>
#include <vector>

#include "relativity/core/coordinates.hpp"
#include "relativity/core/system_config.hpp"
#include "relativity/physics/gravity_field.hpp"
#include "relativity/visuals/color_map.hpp"

namespace Visuals {

struct GridSegment {
    Position from; // pixels
    Position to;   // pixels
    Rgba color;
};

/**
 * @brief Displacement in pixels for one vertex
 * @param fieldMagnitude |g| in m/s^2
 * @param nearestMassPixels Pixel distance from the vertex to the closest mass
 */
double vertexDisplacement(double fieldMagnitude, double nearestMassPixels, const SystemConfig& config);

/**
 * @brief Forward then backward sweep so coords[i+1] - coords[i] >= minSpacing
 */
void enforceMinimumSpacing(std::vector<double>& coords, double minSpacing);

/**
 * @class GravityGrid
 * @brief Warped grid recomputed from the current mass distribution
 */
class GravityGrid {
public:
    GravityGrid(const SystemConfig& config, const Simulation::Coordinates& coords);

    /**
     * @brief Recomputes every vertex and segment for the given masses
     *
     * With no masses the grid is flat and every displacement is zero.
     */
    void rebuild(const std::vector<Physics::MassSample>& masses);

    std::size_t vertexColumns() const { return vertexCols; }
    std::size_t vertexRows() const { return vertexRowCount; }

    const Position& vertex(std::size_t row, std::size_t col) const;
    double displacement(std::size_t row, std::size_t col) const;
    double maxDisplacement() const { return maxDisp; }

    const std::vector<Position>& vertices() const { return positions; }
    const std::vector<GridSegment>& segments() const { return lines; }

private:
    std::size_t index(std::size_t row, std::size_t col) const { return row * vertexCols + col; }

    void displaceVertices(const std::vector<Physics::MassSample>& masses);
    void enforceSpacing();
    void buildSegments();

    SystemConfig config;
    Simulation::Coordinates coords;
    std::size_t vertexCols;
    std::size_t vertexRowCount;

    std::vector<Position> positions;
    std::vector<double> displacements;
    std::vector<GridSegment> lines;
    double maxDisp = 0.0;
};

} // namespace Visuals

#endif // RELATIVITY_GRAVITY_GRID_HPP
