#pragma once

#include <algorithm>
#include <utility>
#include "pt_api/core/math.hpp"
#include "pt_api/core/interval.hpp"
#include "pt_api/physics/ray.hpp"

namespace pt_api::physics {

    /**
     * @brief Caixa alinhada aos eixos, um intervalo por eixo.
     *
     * Caixas criadas a partir de intervalos ou pontos são expandidas para que
     * nenhum eixo fique mais fino que MIN_THICKNESS.
     */
    struct AABB {
        static constexpr double MIN_THICKNESS = 0.0001;

        math::Interval x, y, z;

        AABB() = default;   // vazio

        AABB(const math::Interval& ix, const math::Interval& iy, const math::Interval& iz)
            : x(ix), y(iy), z(iz) {
            padToMinimums();
        }

        // Corner order does not matter
        AABB(const Point3& a, const Point3& b)
            : x(std::min(a.x, b.x), std::max(a.x, b.x)),
              y(std::min(a.y, b.y), std::max(a.y, b.y)),
              z(std::min(a.z, b.z), std::max(a.z, b.z)) {
            padToMinimums();
        }

        static AABB Enclose(const AABB& b0, const AABB& b1) {
            AABB box;
            box.x = math::Interval::Enclose(b0.x, b1.x);
            box.y = math::Interval::Enclose(b0.y, b1.y);
            box.z = math::Interval::Enclose(b0.z, b1.z);
            return box;
        }

        void Grow(const AABB& other) {
            x.Grow(other.x);
            y.Grow(other.y);
            z.Grow(other.z);
        }

        // -------------------------------
        // Utilitários básicos
        // -------------------------------
        const math::Interval& Axis(int n) const {
            if (n == 1) return y;
            if (n == 2) return z;
            return x;
        }

        const math::Interval& operator[](int n) const { return Axis(n); }

        Point3 Min() const { return Point3(x.start, y.start, z.start); }
        Point3 Max() const { return Point3(x.end, y.end, z.end); }

        int LongestAxis() const {
            if (x.Size() > y.Size())
                return x.Size() > z.Size() ? 0 : 2;
            return y.Size() > z.Size() ? 1 : 2;
        }

        AABB operator+(const Vec3& offset) const {
            AABB box;
            box.x = x + offset.x;
            box.y = y + offset.y;
            box.z = z + offset.z;
            return box;
        }

        // -------------------------------
        // Slab test
        // -------------------------------
        // Zero direction components are not special-cased: 1/0 yields ±inf and the
        // comparisons below order it correctly. Swapping on the sign of the
        // direction (not on t0 > t1) keeps empty boxes unhittable.
        bool Hit(const Ray& ray, math::Interval range) const {
            for (int axis = 0; axis < 3; ++axis) {
                const math::Interval& slab = Axis(axis);
                const double adinv = 1.0 / ray.dir[axis];

                double t0 = (slab.start - ray.origin[axis]) * adinv;
                double t1 = (slab.end - ray.origin[axis]) * adinv;
                if (adinv < 0.0) std::swap(t0, t1);

                if (t0 > range.start) range.start = t0;
                if (t1 < range.end) range.end = t1;

                if (range.end <= range.start)
                    return false;
            }
            return true;
        }

    private:
        void padToMinimums() {
            if (x.Size() < MIN_THICKNESS) x.Expand(MIN_THICKNESS);
            if (y.Size() < MIN_THICKNESS) y.Expand(MIN_THICKNESS);
            if (z.Size() < MIN_THICKNESS) z.Expand(MIN_THICKNESS);
        }
    };
}
