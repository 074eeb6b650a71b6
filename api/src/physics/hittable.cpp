#include "pt_api/physics/hittable.hpp"

namespace pt_api::physics {

    void HittableList::Add(std::shared_ptr<Hittable> object) {
        m_bbox.Grow(object->BoundingBox());
        m_objects.push_back(std::move(object));
    }

    void HittableList::Clear() noexcept {
        m_objects.clear();
        m_bbox = AABB();
    }

    bool HittableList::Hit(const Ray& ray, const math::Interval& range, HitRecord& rec, Random& rng) const {
        HitRecord tmp;
        bool hitAnything = false;
        double closest = range.end;

        for (const auto& object : m_objects) {
            if (object->Hit(ray, math::Interval(range.start, closest), tmp, rng)) {
                hitAnything = true;
                closest = tmp.t;
                rec = tmp;
            }
        }

        return hitAnything;
    }
}
