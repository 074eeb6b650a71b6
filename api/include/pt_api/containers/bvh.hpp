#pragma once

#include <vector>
#include <memory>
#include <span>
#include "pt_api/physics/hittable.hpp"

namespace pt_api {
    class Random;

    /**
     * @brief Binary bounding volume hierarchy over a set of primitives.
     *
     * Each level splits its slice at the median after sorting by the box minimum
     * along a randomly chosen axis, so the tree depth is ceil(log2(n)).
     * Built once, read concurrently afterwards.
     */
    class BVHNode : public physics::Hittable
    {
        // only members can name the tag, so only build() creates slice nodes
        struct SliceTag { explicit SliceTag() = default; };

    public:
        /**
         * @brief Build a hierarchy over objects.
         * @param objects Primitives to partition (must not be empty).
         * @param rng Source for the split axis choice.
         * @throws std::invalid_argument if objects is empty.
         */
        BVHNode(std::vector<std::shared_ptr<physics::Hittable>> objects, Random& rng);

        BVHNode(SliceTag, std::span<std::shared_ptr<physics::Hittable>> objects, Random& rng);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override;
        physics::AABB BoundingBox() const override { return m_bbox; }

        /**
         * @brief Number of interior nodes, this one included.
         */
        size_t GetNodeCount() const noexcept { return m_nodeCount; }

        /**
         * @brief Levels of BVHNode from this node down to the deepest leaf pair.
         */
        int GetDepth() const noexcept { return m_depth; }

    private:
        void build(std::span<std::shared_ptr<physics::Hittable>> objects, Random& rng);

        std::shared_ptr<physics::Hittable> m_left;
        std::shared_ptr<physics::Hittable> m_right;
        physics::AABB m_bbox;
        size_t m_nodeCount{1};
        int m_depth{1};
    };
}
