#include "pt_api/graphics/perlin.hpp"
#include "pt_api/core/random.hpp"

#include <numeric>
#include <stdexcept>
#include <cmath>
#include <cstdint>

namespace pt_api {

    Perlin::Perlin(Random& rng, int pointCount)
        : m_pointCount(pointCount)
    {
        if (pointCount <= 0 || (pointCount & (pointCount - 1)) != 0)
            throw std::invalid_argument("Perlin point count must be a power of two");

        m_gradients.reserve(pointCount);
        for (int i = 0; i < pointCount; ++i)
            m_gradients.push_back(rng.UnitVector());

        m_permX = generatePerm(rng, pointCount);
        m_permY = generatePerm(rng, pointCount);
        m_permZ = generatePerm(rng, pointCount);
    }

    double Perlin::Noise(const Point3& p) const
    {
        const int64_t mask = m_pointCount - 1;

        const double u = p.x - std::floor(p.x);
        const double v = p.y - std::floor(p.y);
        const double w = p.z - std::floor(p.z);

        const int64_t i = static_cast<int64_t>(std::floor(p.x));
        const int64_t j = static_cast<int64_t>(std::floor(p.y));
        const int64_t k = static_cast<int64_t>(std::floor(p.z));

        Vec3 c[2][2][2];
        for (int di = 0; di < 2; ++di)
            for (int dj = 0; dj < 2; ++dj)
                for (int dk = 0; dk < 2; ++dk)
                    c[di][dj][dk] = m_gradients[m_permX[(i + di) & mask] ^
                                                m_permY[(j + dj) & mask] ^
                                                m_permZ[(k + dk) & mask]];

        // Hermite
        const double uu = u * u * (3.0 - 2.0 * u);
        const double vv = v * v * (3.0 - 2.0 * v);
        const double ww = w * w * (3.0 - 2.0 * w);

        double accum = 0.0;
        for (int a = 0; a < 2; ++a) {
            for (int b = 0; b < 2; ++b) {
                for (int d = 0; d < 2; ++d) {
                    const Vec3 weight(u - a, v - b, w - d);
                    accum += (a * uu + (1 - a) * (1.0 - uu))
                           * (b * vv + (1 - b) * (1.0 - vv))
                           * (d * ww + (1 - d) * (1.0 - ww))
                           * math::Dot(c[a][b][d], weight);
                }
            }
        }
        return accum;
    }

    double Perlin::Turbulence(const Point3& p, int depth) const
    {
        double accum = 0.0;
        Point3 temp = p;
        double weight = 1.0;

        for (int i = 0; i < depth; ++i) {
            accum += weight * Noise(temp);
            weight *= 0.5;
            temp *= 2.0;
        }

        return std::fabs(accum);
    }

    std::vector<int> Perlin::generatePerm(Random& rng, int pointCount)
    {
        std::vector<int> perm(pointCount);
        std::iota(perm.begin(), perm.end(), 0);
        rng.Shuffle(perm.begin(), perm.end());
        return perm;
    }
}
