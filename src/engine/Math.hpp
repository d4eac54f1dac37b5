#pragma once

#include <algorithm>
#include <cmath>

namespace engine
{

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

// Divisors smaller than this are treated as zero.
constexpr float kEpsilon = 1e-6f;

struct Vec3
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vec3& operator+=(const Vec3& o)
    {
        x += o.x;
        y += o.y;
        z += o.z;
        return *this;
    }
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return { a.x + b.x, a.y + b.y, a.z + b.z }; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return { a.x - b.x, a.y - b.y, a.z - b.z }; }
inline Vec3 operator*(const Vec3& a, float s) { return { a.x * s, a.y * s, a.z * s }; }
inline Vec3 operator*(float s, const Vec3& a) { return a * s; }

inline float dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3 cross(const Vec3& a, const Vec3& b)
{
    return { a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x };
}

inline float lengthSquared(const Vec3& v) { return dot(v, v); }
inline float length(const Vec3& v) { return std::sqrt(dot(v, v)); }
inline float distanceSquared(const Vec3& a, const Vec3& b) { return lengthSquared(a - b); }

// Returns fallback for (near) zero-length input instead of dividing by zero.
inline Vec3 normalize(const Vec3& v, const Vec3& fallback = { 0.0f, 0.0f, 1.0f })
{
    float len = length(v);
    if (len < kEpsilon)
        return fallback;
    return v * (1.0f / len);
}

inline Vec3 rotateX(const Vec3& v, float angle)
{
    float c = std::cos(angle);
    float s = std::sin(angle);
    return { v.x, v.y * c - v.z * s, v.y * s + v.z * c };
}

inline Vec3 rotateY(const Vec3& v, float angle)
{
    float c = std::cos(angle);
    float s = std::sin(angle);
    return { v.x * c + v.z * s, v.y, -v.x * s + v.z * c };
}

inline float mix(float a, float b, float t) { return a + (b - a) * t; }

inline float clamp01(float v) { return std::clamp(v, 0.0f, 1.0f); }

inline float fract(float v) { return v - std::floor(v); }

inline float smoothstep(float edge0, float edge1, float x)
{
    float span = edge1 - edge0;
    if (std::fabs(span) < kEpsilon)
        return x < edge0 ? 0.0f : 1.0f;
    float t = clamp01((x - edge0) / span);
    return t * t * (3.0f - 2.0f * t);
}

} // namespace engine
