#include "pt_api/graphics/material.hpp"
#include "pt_api/graphics/texture.hpp"
#include "pt_api/core/random.hpp"

#include <cmath>

namespace pt_api {

    // --- Lambertian --- //

    Lambertian::Lambertian(const Color& albedo)
        : m_texture(std::make_shared<SolidColor>(albedo))
    {
    }

    bool Lambertian::Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const
    {
        Vec3 direction = rec.normal + rng.UnitVector();

        // direção degenerada
        if (math::NearZero(direction))
            direction = rec.normal;

        out.scattered = physics::Ray(rec.point, direction, in.time);
        out.attenuation = m_texture->Value(rec.u, rec.v, rec.point);
        return true;
    }

    // --- Metal --- //

    bool Metal::Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const
    {
        const Vec3 reflected = math::Normalize(math::Reflect(in.dir, rec.normal)) + m_fuzz * rng.UnitVector();

        out.scattered = physics::Ray(rec.point, reflected, in.time);
        out.attenuation = m_albedo;
        return math::Dot(out.scattered.dir, rec.normal) > 0.0;
    }

    // --- Dielectric --- //

    bool Dielectric::Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const
    {
        const double ri = rec.frontFace ? (1.0 / m_refractionIndex) : m_refractionIndex;

        const Vec3 unitDirection = math::Normalize(in.dir);
        const double cosTheta = std::fmin(math::Dot(-unitDirection, rec.normal), 1.0);
        const double sinTheta = std::sqrt(1.0 - cosTheta * cosTheta);

        const bool cannotRefract = ri * sinTheta > 1.0;
        Vec3 direction;
        if (cannotRefract || Reflectance(cosTheta, ri) > rng.Uniform())
            direction = math::Reflect(unitDirection, rec.normal);
        else
            direction = math::Refract(unitDirection, rec.normal, ri);

        out.scattered = physics::Ray(rec.point, direction, in.time);
        out.attenuation = Color(1.0);
        return true;
    }

    double Dielectric::Reflectance(double cosine, double refractionIndex)
    {
        double r0 = (1.0 - refractionIndex) / (1.0 + refractionIndex);
        r0 = r0 * r0;
        return r0 + (1.0 - r0) * std::pow(1.0 - cosine, 5.0);
    }

    // --- DiffuseLight --- //

    DiffuseLight::DiffuseLight(const Color& emit)
        : m_texture(std::make_shared<SolidColor>(emit))
    {
    }

    Color DiffuseLight::Emitted(double u, double v, const Point3& p) const
    {
        return m_texture->Value(u, v, p);
    }

    // --- Isotropic --- //

    Isotropic::Isotropic(const Color& albedo)
        : m_texture(std::make_shared<SolidColor>(albedo))
    {
    }

    bool Isotropic::Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const
    {
        out.scattered = physics::Ray(rec.point, rng.UnitVector(), in.time);
        out.attenuation = m_texture->Value(rec.u, rec.v, rec.point);
        return true;
    }
}
