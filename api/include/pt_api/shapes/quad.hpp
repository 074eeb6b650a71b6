#pragma once

#include <memory>
#include "pt_api/physics/hittable.hpp"

namespace pt_api {
    class Material;
}

namespace pt_api::shapes {

    /**
     * @brief Paralelogramo com canto Q e arestas u, v.
     *
     * O UV do hit são as coordenadas (alpha, beta) do ponto na base (u, v).
     */
    class Quad : public physics::Hittable {
    public:
        Quad(const Point3& q, const Vec3& u, const Vec3& v, std::shared_ptr<Material> material);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override;
        physics::AABB BoundingBox() const override { return m_bbox; }

        const Point3& GetCorner() const { return m_q; }
        const Vec3& GetU() const { return m_u; }
        const Vec3& GetV() const { return m_v; }
        const Vec3& GetNormal() const { return m_normal; }
        const std::shared_ptr<Material>& GetMaterial() const { return m_material; }

    private:
        Point3 m_q;
        Vec3 m_u, m_v;
        Vec3 m_w;       // n / |n|², projects hit points onto the (u, v) basis
        Vec3 m_normal;
        double m_d;     // plane offset, normal . Q
        std::shared_ptr<Material> m_material;
        physics::AABB m_bbox;
    };
}
