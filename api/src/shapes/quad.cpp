#include "pt_api/shapes/quad.hpp"

#include <cmath>

namespace pt_api::shapes {

    Quad::Quad(const Point3& q, const Vec3& u, const Vec3& v, std::shared_ptr<Material> material)
        : m_q(q), m_u(u), m_v(v), m_material(std::move(material))
    {
        const Vec3 n = math::Cross(u, v);
        m_normal = math::Normalize(n);
        m_d = math::Dot(m_normal, q);
        m_w = n / math::LengthSquared(n);

        const physics::AABB diag1(q, q + u + v);
        const physics::AABB diag2(q + u, q + v);
        m_bbox = physics::AABB::Enclose(diag1, diag2);
    }

    bool Quad::Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random&) const
    {
        const double denom = math::Dot(m_normal, ray.dir);

        // raio paralelo ao plano
        if (std::fabs(denom) < 1e-6)
            return false;

        const double t = (m_d - math::Dot(m_normal, ray.origin)) / denom;
        if (!range.Contains(t))
            return false;

        const Point3 intersection = ray.GetPoint(t);
        const Vec3 planar = intersection - m_q;
        const double alpha = math::Dot(m_w, math::Cross(planar, m_v));
        const double beta = math::Dot(m_w, math::Cross(m_u, planar));

        const math::Interval unit(0.0, 1.0);
        if (!unit.Contains(alpha) || !unit.Contains(beta))
            return false;

        rec.t = t;
        rec.point = intersection;
        rec.u = alpha;
        rec.v = beta;
        rec.material = m_material.get();
        rec.SetFaceNormal(ray, m_normal);
        return true;
    }
}
