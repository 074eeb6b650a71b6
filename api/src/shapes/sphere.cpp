#include "pt_api/shapes/sphere.hpp"

#include <cmath>

namespace pt_api::shapes {

    Sphere::Sphere(const Point3& center, double radius, std::shared_ptr<Material> material)
        : m_center(center), m_radius(radius), m_material(std::move(material))
    {
        const Vec3 rvec(radius);
        m_bbox = physics::AABB(center - rvec, center + rvec);
    }

    Sphere::Sphere(const Point3& center1, const Point3& center2, double radius, std::shared_ptr<Material> material)
        : m_center(center1), m_motion(center2 - center1), m_radius(radius), m_moving(true), m_material(std::move(material))
    {
        const Vec3 rvec(radius);
        const physics::AABB box1(center1 - rvec, center1 + rvec);
        const physics::AABB box2(center2 - rvec, center2 + rvec);
        m_bbox = physics::AABB::Enclose(box1, box2);
    }

    bool Sphere::Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random&) const
    {
        const Point3 center = m_moving ? CenterAt(ray.time) : m_center;
        const Vec3 oc = center - ray.origin;
        const double a = math::LengthSquared(ray.dir);
        const double halfB = math::Dot(ray.dir, oc);
        const double c = math::LengthSquared(oc) - m_radius * m_radius;

        const double discriminant = halfB * halfB - a * c;
        if (discriminant < 0.0)
            return false;

        const double sqrtd = std::sqrt(discriminant);

        // raiz mais próxima dentro do intervalo
        double root = (halfB - sqrtd) / a;
        if (!range.Surrounds(root)) {
            root = (halfB + sqrtd) / a;
            if (!range.Surrounds(root))
                return false;
        }

        rec.t = root;
        rec.point = ray.GetPoint(root);
        const Vec3 outwardNormal = (rec.point - center) / m_radius;
        rec.SetFaceNormal(ray, outwardNormal);
        GetUV(outwardNormal, rec.u, rec.v);
        rec.material = m_material.get();
        return true;
    }

    void Sphere::GetUV(const Point3& p, double& u, double& v)
    {
        const double theta = std::acos(-p.y);
        const double phi = std::atan2(-p.z, p.x) + math::PI;
        u = phi / math::TWO_PI;
        v = theta / math::PI;
    }
}
