#include "pt_api/shapes/constantMedium.hpp"
#include "pt_api/graphics/material.hpp"
#include "pt_api/graphics/texture.hpp"
#include "pt_api/core/random.hpp"

#include <cmath>

namespace pt_api::shapes {

    ConstantMedium::ConstantMedium(std::shared_ptr<physics::Hittable> boundary, double density, std::shared_ptr<Texture> texture)
        : m_boundary(std::move(boundary)),
          m_negInvDensity(-1.0 / density),
          m_phaseFunction(std::make_shared<Isotropic>(std::move(texture)))
    {
    }

    ConstantMedium::ConstantMedium(std::shared_ptr<physics::Hittable> boundary, double density, const Color& albedo)
        : m_boundary(std::move(boundary)),
          m_negInvDensity(-1.0 / density),
          m_phaseFunction(std::make_shared<Isotropic>(albedo))
    {
    }

    bool ConstantMedium::Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const
    {
        physics::HitRecord rec1, rec2;

        // entrada e saída da fronteira, ignorando o intervalo do chamador
        if (!m_boundary->Hit(ray, math::Interval::Universe, rec1, rng))
            return false;
        if (!m_boundary->Hit(ray, math::Interval(rec1.t + 0.0001, math::INF), rec2, rng))
            return false;

        double t1 = rec1.t;
        double t2 = rec2.t;

        if (t1 < range.start) t1 = range.start;
        if (t2 > range.end) t2 = range.end;

        if (t1 >= t2)
            return false;

        if (t1 < 0.0)
            t1 = 0.0;

        const double rayLength = math::Length(ray.dir);
        const double distanceInsideBoundary = (t2 - t1) * rayLength;
        const double hitDistance = m_negInvDensity * std::log(rng.Uniform());

        if (hitDistance > distanceInsideBoundary)
            return false;

        rec.t = t1 + hitDistance / rayLength;
        rec.point = ray.GetPoint(rec.t);
        rec.normal = Vec3(1.0, 0.0, 0.0);
        rec.frontFace = true;
        rec.u = 0.0;
        rec.v = 0.0;
        rec.material = m_phaseFunction.get();
        return true;
    }
}
