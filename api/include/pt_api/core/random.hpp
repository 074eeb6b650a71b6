#pragma once

#include <random>
#include <cstdint>
#include <algorithm>
#include "pt_api/core/math.hpp"

namespace pt_api {

    /**
     * @class Random
     * @brief Fonte de números aleatórios passada explicitamente a quem amostra.
     *
     * Não é thread-safe; cada tarefa tem a sua. O fluxo de cada pixel deriva de
     * (seed, pixelIndex), então o resultado não depende da divisão entre workers.
     */
    class Random {
    public:
        explicit Random(uint64_t seed = 42) {
            std::seed_seq seq{ static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32) };
            m_engine.seed(seq);
        }

        static Random ForPixel(uint64_t seed, uint64_t pixelIndex) {
            Random r;
            std::seed_seq seq{ static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                               static_cast<uint32_t>(pixelIndex), static_cast<uint32_t>(pixelIndex >> 32) };
            r.m_engine.seed(seq);
            return r;
        }

        /// Uniforme em [0, 1).
        double Uniform() { return m_dist(m_engine); }

        /// Uniforme em [min, max).
        double Uniform(double min, double max) { return min + (max - min) * Uniform(); }

        /// Inteiro uniforme em [min, max].
        int UniformInt(int min, int max) {
            std::uniform_int_distribution<int> d(min, max);
            return d(m_engine);
        }

        math::Vec3 InRange(double min, double max) {
            const double x = Uniform(min, max);
            const double y = Uniform(min, max);
            const double z = Uniform(min, max);
            return math::Vec3(x, y, z);
        }

        math::Vec3 InUnitSphere() {
            while (true) {
                const math::Vec3 p = InRange(-1.0, 1.0);
                if (math::LengthSquared(p) < 1.0)
                    return p;
            }
        }

        math::Vec3 UnitVector() {
            // rejeita pontos muito próximos da origem antes de normalizar
            while (true) {
                const math::Vec3 p = InUnitSphere();
                const double lensq = math::LengthSquared(p);
                if (lensq > 1e-160)
                    return p / std::sqrt(lensq);
            }
        }

        math::Vec3 InUnitDisk() {
            while (true) {
                const double x = Uniform(-1.0, 1.0);
                const double y = Uniform(-1.0, 1.0);
                const math::Vec3 p(x, y, 0.0);
                if (math::LengthSquared(p) < 1.0)
                    return p;
            }
        }

        template<typename RandomIt>
        void Shuffle(RandomIt first, RandomIt last) { std::shuffle(first, last, m_engine); }

    private:
        std::mt19937 m_engine;
        std::uniform_real_distribution<double> m_dist{ 0.0, 1.0 };
    };

} // namespace pt_api
