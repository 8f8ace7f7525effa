#pragma once
#include <Eigen/Dense>
#include <cmath>

namespace geom {

struct AABB3f {
    Eigen::Vector3f min;
    Eigen::Vector3f max;

    AABB3f() : min(Eigen::Vector3f::Zero()), max(Eigen::Vector3f::Ones()) {}
    AABB3f(const Eigen::Vector3f& lo, const Eigen::Vector3f& hi) : min(lo), max(hi) {}

    Eigen::Vector3f extent() const noexcept { return max - min; }
    Eigen::Vector3f center() const noexcept { return 0.5f * (min + max); }
    float max_extent() const noexcept { return extent().maxCoeff(); }

    bool valid() const noexcept {
        return min.allFinite() && max.allFinite() && (max.array() > min.array()).all();
    }

    bool contains(const Eigen::Vector3f& p) const noexcept {
        return (p.array() >= min.array()).all() && (p.array() <= max.array()).all();
    }

    // Maps p into [0,1]^3 (unclamped); degenerate axes map to 0
    Eigen::Vector3f normalize(const Eigen::Vector3f& p) const noexcept {
        Eigen::Vector3f e = extent();
        Eigen::Vector3f out;
        for (int a = 0; a < 3; ++a) {
            out[a] = e[a] > 0.0f ? (p[a] - min[a]) / e[a] : 0.0f;
        }
        return out;
    }

    bool operator==(const AABB3f& o) const noexcept { return min == o.min && max == o.max; }
    bool operator!=(const AABB3f& o) const noexcept { return !(*this == o); }
};

} // namespace geom
