#pragma once

#include "footfall/core/types.hpp"

#include <cstddef>

namespace footfall {

// Cross products smaller than this count as "on the line"
constexpr double kSideEpsilon = 1e-6;

/**
 * @brief Which side of the directed line (p1 -> p2) a point lies on
 *
 * Sign of cross(p2 - p1, point - p1). Degenerate lines yield 0 for
 * every point.
 *
 * @return -1, 0 or +1
 */
int side_of_line(const Point& point, const Line& line);

/**
 * @brief Ray-casting (edge crossing parity) point-in-polygon test
 */
bool point_in_polygon(const Point& point, const Point* polygon, size_t count);

inline bool point_in_zone(const Point& point, const Zone& zone) {
    return point_in_polygon(point, zone.points().data(), zone.points().size());
}

/**
 * @brief Euclidean norm
 */
float l2_norm(const Embedding& v);

/**
 * @brief Unit-length copy of v; zero and empty vectors are returned unchanged
 */
Embedding l2_normalize(const Embedding& v);

/**
 * @brief Dot product of two unit vectors
 *
 * Returns 0 when the dimensions differ or either vector is empty.
 */
float cosine_similarity(const Embedding& a, const Embedding& b);

}  // namespace footfall
