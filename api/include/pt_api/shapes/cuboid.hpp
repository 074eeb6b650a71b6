#pragma once

#include <memory>
#include "pt_api/physics/hittable.hpp"

namespace pt_api {
    class Material;
}

namespace pt_api::shapes {

    /**
     * @brief Caixa alinhada aos eixos formada por seis quads, a partir de dois cantos opostos.
     */
    class Cuboid : public physics::Hittable {
    public:
        Cuboid(const Point3& a, const Point3& b, std::shared_ptr<Material> material);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override {
            return m_faces.Hit(ray, range, rec, rng);
        }
        physics::AABB BoundingBox() const override { return m_faces.BoundingBox(); }

        const physics::HittableList& GetFaces() const { return m_faces; }

    private:
        physics::HittableList m_faces;
    };
}
