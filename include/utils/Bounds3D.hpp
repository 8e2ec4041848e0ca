/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BOUNDS_3D_HPP
#define BOUNDS_3D_HPP

#include "utils/Vector3D.hpp"

namespace Wayfinder {

// Axis-aligned bounding volume stored as min/max corners.
// A default-constructed box is empty (min > max) and takes the extent of
// whatever it is first expanded by.
struct Bounds3D {
    Vector3D min;
    Vector3D max;

    Bounds3D();
    Bounds3D(const Vector3D& minCorner, const Vector3D& maxCorner);

    bool isEmpty() const;

    void expandByPoint(const Vector3D& p);
    void expandByBounds(const Bounds3D& other);

    bool contains(const Vector3D& p) const;
};

} // namespace Wayfinder

#endif // BOUNDS_3D_HPP
