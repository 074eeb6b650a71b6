#pragma once

#include "pt_api/core/math.hpp"
#include "pt_api/core/diagnostics.hpp"
#include "pt_api/physics/hittable.hpp"
#include "pt_api/graphics/camera.hpp"
#include "pt_api/graphics/image.hpp"

namespace pt_api {
    class ThreadPool;

    /**
     * @brief Path tracing Monte Carlo sobre o thread pool.
     *
     * Mundo e câmera são apenas lidos durante a renderização. Cada pixel usa o
     * próprio fluxo aleatório; a imagem não depende do número de workers.
     */
    class Renderer {
    public:
        explicit Renderer(ThreadPool& pool) : m_pool(pool) {}

        /**
         * @brief Renderiza a imagem inteira, uma tarefa por linha.
         *
         * Exceções das tarefas são relançadas aqui.
         */
        Framebuffer Render(const physics::Hittable& world, const Camera& camera);

        /**
         * @brief Radiância trazida por um caminho.
         *
         * Sem hit soma o fundo; um hit soma a emissão. No máximo maxDepth
         * espalhamentos são seguidos; a superfície alcançada depois do último
         * contribui apenas com a emissão.
         */
        static Color RayColor(const physics::Ray& ray, const physics::Hittable& world, int maxDepth,
                              const Color& background, Random& rng);

        /// Média de samplesPerPixel caminhos pelo pixel (i, j), com o fluxo do próprio pixel.
        static Color SamplePixel(const Camera& camera, const physics::Hittable& world, int i, int j);

        /// Tempos por linha da última renderização.
        const TimerSampler& GetScanlineTimes() const { return m_scanlineTimes; }
        double GetLastRenderSeconds() const { return m_lastRenderSeconds; }

    private:
        ThreadPool& m_pool;
        TimerSampler m_scanlineTimes;
        double m_lastRenderSeconds = 0.0;
    };
}
