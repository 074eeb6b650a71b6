#pragma once

#include "pt_api/core/math.hpp"

namespace pt_api::physics {
    struct Ray {
        Point3 origin;
        Vec3 dir;           // não normalizado
        double time = 0.0;  // [0,1], instante usado pelo motion blur

        Ray() = default;
        Ray(const Point3& o, const Vec3& d, double t = 0.0)
            : origin(o), dir(d), time(t) {}

        Point3 GetPoint(double t) const { return origin + t * dir; }
    };
}
