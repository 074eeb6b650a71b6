#pragma once

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtx/euler_angles.hpp>
#include <glm/gtx/norm.hpp>
#include <glm/gtc/constants.hpp>

#include <concepts>
#include <cmath>
#include <string>
#include <algorithm>
#include <limits>
#include <fmt/core.h>

namespace pt_api::math
{
    // --- Typedefs --- //
    using Vec3 = glm::dvec3;
    using Point3 = glm::dvec3;
    using Color = glm::dvec3;

    using Mat3 = glm::dmat3;

    // --- Constantes matemáticas --- //
    constexpr double PI = glm::pi<double>();
    constexpr double TWO_PI = glm::two_pi<double>();
    constexpr double DEG2RAD = PI / 180.0;
    constexpr double INF = std::numeric_limits<double>::infinity();

    // --- Conversões --- //
    constexpr double ToRadians(double degrees) { return degrees * DEG2RAD; }

    template <std::floating_point T>
    constexpr T Clamp(T v, T min, T max) { return std::clamp(v, min, max); }

    // --- Vetores --- //
    inline double Dot(const Vec3& a, const Vec3& b) { return glm::dot(a, b); }
    inline Vec3 Cross(const Vec3& a, const Vec3& b) { return glm::cross(a, b); }
    inline double Length(const Vec3& v) { return glm::length(v); }
    inline double LengthSquared(const Vec3& v) { return glm::length2(v); }

    // sem proteção contra vetor nulo
    inline Vec3 Normalize(const Vec3& v) { return v / glm::length(v); }

    inline bool NearZero(const Vec3& v)
    {
        constexpr double s = 1e-6;
        return std::fabs(v.x) < s && std::fabs(v.y) < s && std::fabs(v.z) < s;
    }

    inline Vec3 Reflect(const Vec3& v, const Vec3& n) { return v - 2.0 * glm::dot(v, n) * n; }

    /**
     * @brief Refrata uma direção unitária numa superfície de normal unitária n.
     * @param uv Direção incidente unitária.
     * @param n Normal unitária do lado incidente.
     * @param etaiOverEtat Razão dos índices de refração (incidente / transmitido).
     */
    inline Vec3 Refract(const Vec3& uv, const Vec3& n, double etaiOverEtat)
    {
        const double cosTheta = std::fmin(glm::dot(-uv, n), 1.0);
        const Vec3 rOutPerp = etaiOverEtat * (uv + cosTheta * n);
        const Vec3 rOutParallel = -std::sqrt(std::fabs(1.0 - glm::length2(rOutPerp))) * n;
        return rOutPerp + rOutParallel;
    }

    // --- Matrizes --- //
    /**
     * @brief Rotação Rx * Ry * Rz a partir de ângulos de Euler em graus.
     */
    inline Mat3 RotationXYZ(const Vec3& degrees)
    {
        const Mat3 rx(glm::eulerAngleX(ToRadians(degrees.x)));
        const Mat3 ry(glm::eulerAngleY(ToRadians(degrees.y)));
        const Mat3 rz(glm::eulerAngleZ(ToRadians(degrees.z)));
        return rx * ry * rz;
    }

    // --- Utilitários gerais --- //
    inline std::string ToString(const Vec3& v)
    {
        return fmt::format("({:.4f}, {:.4f}, {:.4f})", v.x, v.y, v.z);
    }
} // namespace pt_api::math

namespace pt_api {
    using math::Vec3;
    using math::Point3;
    using math::Color;
    using math::Mat3;
}
