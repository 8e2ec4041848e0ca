/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Bounds3D.hpp"
#include <algorithm>
#include <limits>

namespace Wayfinder {

namespace {
constexpr float kInf = std::numeric_limits<float>::infinity();
}

Bounds3D::Bounds3D()
    : min(kInf, kInf, kInf), max(-kInf, -kInf, -kInf) {}

Bounds3D::Bounds3D(const Vector3D& minCorner, const Vector3D& maxCorner)
    : min(minCorner), max(maxCorner) {}

bool Bounds3D::isEmpty() const {
    return max.getX() < min.getX() || max.getY() < min.getY() ||
           max.getZ() < min.getZ();
}

void Bounds3D::expandByPoint(const Vector3D& p) {
    min = Vector3D(std::min(min.getX(), p.getX()),
                   std::min(min.getY(), p.getY()),
                   std::min(min.getZ(), p.getZ()));
    max = Vector3D(std::max(max.getX(), p.getX()),
                   std::max(max.getY(), p.getY()),
                   std::max(max.getZ(), p.getZ()));
}

void Bounds3D::expandByBounds(const Bounds3D& other) {
    if (other.isEmpty()) return;
    expandByPoint(other.min);
    expandByPoint(other.max);
}

bool Bounds3D::contains(const Vector3D& p) const {
    return p.getX() >= min.getX() && p.getX() <= max.getX() &&
           p.getY() >= min.getY() && p.getY() <= max.getY() &&
           p.getZ() >= min.getZ() && p.getZ() <= max.getZ();
}

} // namespace Wayfinder
