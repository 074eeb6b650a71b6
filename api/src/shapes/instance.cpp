#include "pt_api/shapes/instance.hpp"

#include <algorithm>

namespace pt_api::shapes {

    // --- Translated --- //

    Translated::Translated(std::shared_ptr<physics::Hittable> object, const Vec3& offset)
        : m_object(std::move(object)), m_offset(offset)
    {
        m_bbox = m_object->BoundingBox() + offset;
    }

    bool Translated::Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const
    {
        const physics::Ray offsetRay(ray.origin - m_offset, ray.dir, ray.time);

        if (!m_object->Hit(offsetRay, range, rec, rng))
            return false;

        rec.point += m_offset;
        return true;
    }

    // --- Rotated --- //

    Rotated::Rotated(std::shared_ptr<physics::Hittable> object, const Vec3& degrees)
        : m_object(std::move(object))
    {
        m_rotation = math::RotationXYZ(degrees);
        m_inverse = glm::transpose(m_rotation);

        const physics::AABB box = m_object->BoundingBox();
        Point3 min(math::INF);
        Point3 max(-math::INF);

        for (int i = 0; i < 2; ++i) {
            for (int j = 0; j < 2; ++j) {
                for (int k = 0; k < 2; ++k) {
                    const double x = i * box.x.end + (1 - i) * box.x.start;
                    const double y = j * box.y.end + (1 - j) * box.y.start;
                    const double z = k * box.z.end + (1 - k) * box.z.start;

                    const Point3 corner = m_rotation * Point3(x, y, z);
                    min = glm::min(min, corner);
                    max = glm::max(max, corner);
                }
            }
        }

        m_bbox = physics::AABB(min, max);
    }

    bool Rotated::Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const
    {
        const physics::Ray rotatedRay(m_inverse * ray.origin, m_inverse * ray.dir, ray.time);

        if (!m_object->Hit(rotatedRay, range, rec, rng))
            return false;

        rec.point = m_rotation * rec.point;
        rec.normal = m_rotation * rec.normal;
        return true;
    }
}
