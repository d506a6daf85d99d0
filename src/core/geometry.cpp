#include "footfall/core/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace footfall {

namespace {

constexpr float kNormEpsilon = 1e-12f;

}  // namespace

int side_of_line(const Point& point, const Line& line) {
    if (line.is_degenerate()) {
        return 0;
    }

    double cross = (line.p2.x - line.p1.x) * (point.y - line.p1.y) -
                   (line.p2.y - line.p1.y) * (point.x - line.p1.x);

    if (std::abs(cross) < kSideEpsilon) {
        return 0;
    }
    return cross > 0.0 ? 1 : -1;
}

bool point_in_polygon(const Point& point, const Point* polygon, size_t count) {
    if (polygon == nullptr || count < 3) {
        return false;
    }

    bool inside = false;
    for (size_t i = 0, j = count - 1; i < count; j = i++) {
        const Point& a = polygon[j];
        const Point& b = polygon[i];

        if (point.y > std::min(a.y, b.y) && point.y <= std::max(a.y, b.y) &&
            point.x <= std::max(a.x, b.x)) {
            // Horizontal edges never get here: the y range above is empty
            double x_cross = (point.y - a.y) * (b.x - a.x) / (b.y - a.y) + a.x;
            if (a.x == b.x || point.x <= x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

float l2_norm(const Embedding& v) {
    float sum = std::inner_product(v.begin(), v.end(), v.begin(), 0.0f);
    return std::sqrt(sum);
}

Embedding l2_normalize(const Embedding& v) {
    float norm = l2_norm(v);
    if (norm < kNormEpsilon) {
        return v;
    }

    Embedding out(v.size());
    std::transform(v.begin(), v.end(), out.begin(),
                   [norm](float x) { return x / norm; });
    return out;
}

float cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0f);
}

}  // namespace footfall
