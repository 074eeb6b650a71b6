#pragma once

#include <vector>
#include "pt_api/core/math.hpp"

namespace pt_api {
    class Random;

    /**
     * @brief Ruído de gradiente sobre uma grade de vetores unitários aleatórios.
     *
     * Os cantos da grade são indexados por permX[i] ^ permY[j] ^ permZ[k], então o
     * tamanho da tabela deve ser potência de dois.
     */
    class Perlin {
    public:
        static constexpr int DEFAULT_POINT_COUNT = 256;

        /// @throws std::invalid_argument se pointCount não for potência de dois positiva.
        explicit Perlin(Random& rng, int pointCount = DEFAULT_POINT_COUNT);

        /// Ruído em aproximadamente [-1, 1], interpolado com pesos de Hermite.
        double Noise(const Point3& p) const;

        /// Soma absoluta de depth oitavas, cada uma com o dobro da frequência e metade da amplitude.
        double Turbulence(const Point3& p, int depth = 7) const;

        int GetPointCount() const noexcept { return m_pointCount; }

    private:
        static std::vector<int> generatePerm(Random& rng, int pointCount);

        int m_pointCount;
        std::vector<Vec3> m_gradients;
        std::vector<int> m_permX;
        std::vector<int> m_permY;
        std::vector<int> m_permZ;
    };
}
