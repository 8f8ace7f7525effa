#pragma once
#include "GpuDevice.h"
#include <Eigen/Dense>
#include <cmath>

// Moment algebra shared by aggregation, reduction and traversal.
// All accelerations here are per unit G.
namespace multipole {

// Raw moments one point mass deposits into a voxel
inline void point_moments(const Eigen::Vector3f& p, float m,
                          gpu::Texel& a0, gpu::Texel& a1, gpu::Texel& a2) {
    a0 = gpu::Texel(m * p.x(), m * p.y(), m * p.z(), m);
    a1 = gpu::Texel(m * p.x() * p.x(), m * p.y() * p.y(), m * p.z() * p.z(), m * p.x() * p.y());
    a2 = gpu::Texel(m * p.x() * p.z(), m * p.y() * p.z(), 0.0f, 0.0f);
}

/*  Central second moment S = M2 - M0 * mu mu^T, where M2 is assembled from
    the raw sums in A1/A2 and mu = A0.xyz / M0. Requires A0.w > 0.
*/
inline Eigen::Matrix3f central_second_moment(const gpu::Texel& a0,
                                             const gpu::Texel& a1,
                                             const gpu::Texel& a2) {
    const float m0 = a0.w();
    const Eigen::Vector3f mu = a0.head<3>() / m0;
    Eigen::Matrix3f m2;
    m2 << a1.x(), a1.w(), a2.x(),
          a1.w(), a1.y(), a2.y(),
          a2.x(), a2.y(), a1.z();
    return m2 - m0 * (mu * mu.transpose());
}

// Trace-free quadrupole tensor Q = 3S - tr(S) I
inline Eigen::Matrix3f traceless_quadrupole(const Eigen::Matrix3f& s) {
    return 3.0f * s - s.trace() * Eigen::Matrix3f::Identity();
}

// r points from the field point to the source, eps2 = softening^2
inline Eigen::Vector3f monopole_acceleration(const Eigen::Vector3f& r, float mass, float eps2) {
    const float r2 = r.squaredNorm() + eps2;
    const float inv_r = 1.0f / std::sqrt(r2);
    const float inv_r3 = inv_r * inv_r * inv_r;
    return (mass * inv_r3) * r;
}

/*  Quadrupole correction of a cell seen from a field point at offset r
    (field point -> centre of mass). With x = -r the cell-to-point
    separation, a = Q x / R^5 - 2.5 (x^T Q x) x / R^7 and R^2 = |x|^2 + eps2.
    Both terms are odd in x, so the result is written directly in r.
*/
inline Eigen::Vector3f quadrupole_acceleration(const Eigen::Vector3f& r,
                                               const Eigen::Matrix3f& q,
                                               float eps2) {
    const float r2 = r.squaredNorm() + eps2;
    const float inv_r = 1.0f / std::sqrt(r2);
    const float inv_r2 = inv_r * inv_r;
    const float inv_r5 = inv_r2 * inv_r2 * inv_r;
    const float inv_r7 = inv_r5 * inv_r2;
    const Eigen::Vector3f qr = q * r;
    const float rqr = r.dot(qr);
    return -inv_r5 * qr + (2.5f * rqr * inv_r7) * r;
}

// Monopole plus (optionally) quadrupole acceleration of a non-empty cell
inline Eigen::Vector3f cell_acceleration(const Eigen::Vector3f& pos,
                                         const gpu::Texel& a0,
                                         const gpu::Texel& a1,
                                         const gpu::Texel& a2,
                                         float eps2,
                                         bool with_quadrupole) {
    const float m0 = a0.w();
    const Eigen::Vector3f com = a0.head<3>() / m0;
    const Eigen::Vector3f r = com - pos;
    Eigen::Vector3f acc = monopole_acceleration(r, m0, eps2);
    if (with_quadrupole) {
        acc += quadrupole_acceleration(r, traceless_quadrupole(central_second_moment(a0, a1, a2)), eps2);
    }
    return acc;
}

} // namespace multipole
