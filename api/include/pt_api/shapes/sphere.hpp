#pragma once

#include <memory>
#include "pt_api/physics/hittable.hpp"

namespace pt_api {
    class Material;
}

namespace pt_api::shapes {

    /**
     * @brief Esfera parada ou em movimento linear entre dois centros no tempo [0,1].
     */
    class Sphere : public physics::Hittable {
    public:
        Sphere(const Point3& center, double radius, std::shared_ptr<Material> material);
        Sphere(const Point3& center1, const Point3& center2, double radius, std::shared_ptr<Material> material);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override;
        physics::AABB BoundingBox() const override { return m_bbox; }

        Point3 CenterAt(double time) const { return m_center + time * m_motion; }
        double GetRadius() const { return m_radius; }
        bool IsMoving() const { return m_moving; }
        const std::shared_ptr<Material>& GetMaterial() const { return m_material; }

        /**
         * @brief Coordenadas esféricas de um ponto da esfera unitária.
         * @param p Normal unitária para fora.
         * @param u Azimute em [0,1], a partir de -X.
         * @param v Ângulo polar em [0,1], de -Y a +Y.
         */
        static void GetUV(const Point3& p, double& u, double& v);

    private:
        Point3 m_center;
        Vec3 m_motion{ 0.0 };
        double m_radius;
        bool m_moving = false;
        std::shared_ptr<Material> m_material;
        physics::AABB m_bbox;
    };
}
