/**
 * @file gravity_grid.cpp
 * @brief Vertex displacement, spacing sweeps and segment coloring
 */

#include "relativity/visuals/gravity_grid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "relativity/core/profile.hpp"

namespace Visuals {

double vertexDisplacement(double fieldMagnitude, double nearestMassPixels, const SystemConfig& config) {
    if (fieldMagnitude <= 0.0) {
        return 0.0;
    }
    double const logScaled = std::log(1.0 + fieldMagnitude / config.GridReferenceFieldStrength)
                           * config.GridDisplacementScale;
    double const nearCap = config.GridNearestMassFraction * std::max(nearestMassPixels, 0.0);
    return std::min({logScaled, config.GridMaxDisplacementPixels, nearCap});
}

void enforceMinimumSpacing(std::vector<double>& coords, double minSpacing) {
    if (coords.size() < 2) {
        return;
    }
    for (std::size_t i = 1; i < coords.size(); ++i) {
        coords[i] = std::max(coords[i], coords[i - 1] + minSpacing);
    }
    for (std::size_t i = coords.size() - 1; i-- > 0;) {
        coords[i] = std::min(coords[i], coords[i + 1] - minSpacing);
    }
}

GravityGrid::GravityGrid(const SystemConfig& config, const Simulation::Coordinates& coords)
    : config(config),
      coords(coords),
      vertexCols(config.GridColumns + 1),
      vertexRowCount(config.GridRows + 1),
      positions(vertexCols * vertexRowCount),
      displacements(vertexCols * vertexRowCount, 0.0)
{
}

const Position& GravityGrid::vertex(std::size_t row, std::size_t col) const {
    return positions.at(index(row, col));
}

double GravityGrid::displacement(std::size_t row, std::size_t col) const {
    return displacements.at(index(row, col));
}

void GravityGrid::rebuild(const std::vector<Physics::MassSample>& masses) {
    PROFILE_SCOPE("GravityGrid::rebuild");

    displaceVertices(masses);
    enforceSpacing();
    buildSegments();
}

void GravityGrid::displaceVertices(const std::vector<Physics::MassSample>& masses) {
    maxDisp = 0.0;

    for (std::size_t row = 0; row < vertexRowCount; ++row) {
        for (std::size_t col = 0; col < vertexCols; ++col) {
            double const fx = static_cast<double>(col) / config.GridColumns;
            double const fy = static_cast<double>(row) / config.GridRows;

            Position const world = coords.fractionToWorld(fx, fy);
            Position const base = coords.fractionToScreen(fx, fy);

            double nearestPixels = std::numeric_limits<double>::infinity();
            for (const auto& m : masses) {
                nearestPixels = std::min(nearestPixels, coords.metersToPixels(world.dist(m.position)));
            }

            Physics::FieldSample const field = Physics::computeFieldAtPoint(world, masses);
            double const disp = vertexDisplacement(field.magnitude, nearestPixels, config);

            positions[index(row, col)] = base + field.direction * disp;
            displacements[index(row, col)] = disp;
            maxDisp = std::max(maxDisp, disp);
        }
    }
}

void GravityGrid::enforceSpacing() {
    std::vector<double> line;

    // x must increase along every row
    line.resize(vertexCols);
    for (std::size_t row = 0; row < vertexRowCount; ++row) {
        for (std::size_t col = 0; col < vertexCols; ++col) {
            line[col] = positions[index(row, col)].x;
        }
        enforceMinimumSpacing(line, config.GridMinSpacingPixels);
        for (std::size_t col = 0; col < vertexCols; ++col) {
            positions[index(row, col)].x = line[col];
        }
    }

    // y must increase down every column
    line.resize(vertexRowCount);
    for (std::size_t col = 0; col < vertexCols; ++col) {
        for (std::size_t row = 0; row < vertexRowCount; ++row) {
            line[row] = positions[index(row, col)].y;
        }
        enforceMinimumSpacing(line, config.GridMinSpacingPixels);
        for (std::size_t row = 0; row < vertexRowCount; ++row) {
            positions[index(row, col)].y = line[row];
        }
    }
}

void GravityGrid::buildSegments() {
    double const safeMax = maxDisp < 1e-6 ? 1.0 : maxDisp;

    lines.clear();
    lines.reserve(vertexRowCount * (vertexCols - 1) + (vertexRowCount - 1) * vertexCols);

    for (std::size_t row = 0; row < vertexRowCount; ++row) {
        for (std::size_t col = 0; col + 1 < vertexCols; ++col) {
            std::size_t const a = index(row, col);
            std::size_t const b = index(row, col + 1);
            lines.push_back({positions[a], positions[b],
                             curvatureColor(displacements[a], displacements[b], safeMax)});
        }
    }

    for (std::size_t row = 0; row + 1 < vertexRowCount; ++row) {
        for (std::size_t col = 0; col < vertexCols; ++col) {
            std::size_t const a = index(row, col);
            std::size_t const b = index(row + 1, col);
            lines.push_back({positions[a], positions[b],
                             curvatureColor(displacements[a], displacements[b], safeMax)});
        }
    }
}

} // namespace Visuals
