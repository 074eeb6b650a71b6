#pragma once

#include <memory>
#include "pt_api/physics/hittable.hpp"

namespace pt_api::shapes {

    /**
     * @brief Desloca um objeto sem copiá-lo.
     */
    class Translated : public physics::Hittable {
    public:
        Translated(std::shared_ptr<physics::Hittable> object, const Vec3& offset);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override;
        physics::AABB BoundingBox() const override { return m_bbox; }

        const Vec3& GetOffset() const { return m_offset; }
        const std::shared_ptr<physics::Hittable>& GetObject() const { return m_object; }

    private:
        std::shared_ptr<physics::Hittable> m_object;
        Vec3 m_offset;
        physics::AABB m_bbox;
    };

    /**
     * @brief Rotaciona um objeto em torno da origem por ângulos de Euler em graus (Rx * Ry * Rz).
     *
     * Raios entram no espaço do objeto pela transposta; pontos e normais voltam
     * pela matriz direta. A caixa é o min/max dos oito cantos rotacionados.
     */
    class Rotated : public physics::Hittable {
    public:
        Rotated(std::shared_ptr<physics::Hittable> object, const Vec3& degrees);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override;
        physics::AABB BoundingBox() const override { return m_bbox; }

        const Mat3& GetRotation() const { return m_rotation; }
        const Mat3& GetInverseRotation() const { return m_inverse; }
        const std::shared_ptr<physics::Hittable>& GetObject() const { return m_object; }

    private:
        std::shared_ptr<physics::Hittable> m_object;
        Mat3 m_rotation;
        Mat3 m_inverse;
        physics::AABB m_bbox;
    };
}
