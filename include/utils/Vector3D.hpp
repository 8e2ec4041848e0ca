/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>

// A simple 3D vector class. Y is the vertical axis.
class Vector3D {
public:
    // Constructors
    Vector3D() : m_x(0.0f), m_y(0.0f), m_z(0.0f) {}
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    // Length of the projection onto the ground (XZ) plane
    float horizontalLength() const { return std::sqrt(m_x * m_x + m_z * m_z); }

    // Rotates about the vertical axis (right-handed, Y up)
    Vector3D rotatedAboutY(float radians) const {
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        return Vector3D(c * m_x + s * m_z, m_y, -s * m_x + c * m_z);
    }

    // Operator overloads
    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }

    bool isFinite() const {
        return std::isfinite(m_x) && std::isfinite(m_y) && std::isfinite(m_z);
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return (b - a).length();
    }

    // t is not clamped; callers interpolate within [0,1]
    static Vector3D lerp(const Vector3D& a, const Vector3D& b, float t) {
        return Vector3D(a.m_x + (b.m_x - a.m_x) * t,
                        a.m_y + (b.m_y - a.m_y) * t,
                        a.m_z + (b.m_z - a.m_z) * t);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

#endif  // VECTOR_3D_HPP
