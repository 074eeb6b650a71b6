#include "pt_api/containers/bvh.hpp"
#include "pt_api/core/random.hpp"

#include <algorithm>
#include <stdexcept>

namespace pt_api {

    BVHNode::BVHNode(std::vector<std::shared_ptr<physics::Hittable>> objects, Random& rng)
    {
        if (objects.empty())
            throw std::invalid_argument("BVHNode requires at least one object");

        build(std::span<std::shared_ptr<physics::Hittable>>(objects), rng);
    }

    BVHNode::BVHNode(SliceTag, std::span<std::shared_ptr<physics::Hittable>> objects, Random& rng)
    {
        build(objects, rng);
    }

    void BVHNode::build(std::span<std::shared_ptr<physics::Hittable>> objects, Random& rng)
    {
        const int axis = rng.UniformInt(0, 2);
        const size_t span = objects.size();

        if (span == 1) {
            // folha única: os dois filhos apontam para o mesmo objeto
            m_left = m_right = objects[0];
        } else if (span == 2) {
            m_left = objects[0];
            m_right = objects[1];
        } else {
            std::sort(objects.begin(), objects.end(),
                [axis](const std::shared_ptr<physics::Hittable>& a, const std::shared_ptr<physics::Hittable>& b) {
                    return a->BoundingBox().Axis(axis).start < b->BoundingBox().Axis(axis).start;
                });

            const size_t mid = span / 2;
            auto left = std::make_shared<BVHNode>(SliceTag{}, objects.first(mid), rng);
            auto right = std::make_shared<BVHNode>(SliceTag{}, objects.subspan(mid), rng);

            m_nodeCount = 1 + left->m_nodeCount + right->m_nodeCount;
            m_depth = 1 + std::max(left->m_depth, right->m_depth);

            m_left = std::move(left);
            m_right = std::move(right);
        }

        m_bbox = physics::AABB::Enclose(m_left->BoundingBox(), m_right->BoundingBox());
    }

    bool BVHNode::Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const
    {
        if (!m_bbox.Hit(ray, range))
            return false;

        // Both children see the full input interval; the closer hit wins.
        physics::HitRecord leftRec;
        physics::HitRecord rightRec;
        const bool hitLeft = m_left->Hit(ray, range, leftRec, rng);
        const bool hitRight = m_right->Hit(ray, range, rightRec, rng);

        if (hitLeft && hitRight) {
            rec = leftRec.t < rightRec.t ? leftRec : rightRec;
            return true;
        }
        if (hitLeft) {
            rec = leftRec;
            return true;
        }
        if (hitRight) {
            rec = rightRec;
            return true;
        }
        return false;
    }
}
