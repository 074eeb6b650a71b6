#include "pt_api/graphics/renderer.hpp"
#include "pt_api/graphics/material.hpp"
#include "pt_api/core/threadPool.hpp"
#include "pt_api/core/random.hpp"
#include "pt_api/core/debug.hpp"

#include <vector>
#include <future>
#include <exception>

namespace pt_api {

    Color Renderer::RayColor(const physics::Ray& ray, const physics::Hittable& world, int maxDepth,
                             const Color& background, Random& rng)
    {
        Color radiance(0.0);
        Color throughput(1.0);
        physics::Ray current = ray;

        for (int depth = 0;; ++depth) {
            physics::HitRecord rec;
            if (!world.Hit(current, math::Interval(0.001, math::INF), rec, rng)) {
                radiance += throughput * background;
                break;
            }

            if (!rec.material)
                break;

            radiance += throughput * rec.material->Emitted(rec.u, rec.v, rec.point);

            if (depth >= maxDepth)
                break;

            ScatterRecord scatter;
            if (!rec.material->Scatter(current, rec, scatter, rng))
                break;

            throughput *= scatter.attenuation;
            current = scatter.scattered;
        }

        return radiance;
    }

    Color Renderer::SamplePixel(const Camera& camera, const physics::Hittable& world, int i, int j)
    {
        const CameraSettings& settings = camera.GetSettings();
        const uint64_t pixelIndex = static_cast<uint64_t>(j) * camera.GetImageWidth() + i;
        Random rng = Random::ForPixel(settings.seed, pixelIndex);

        Color sum(0.0);
        for (int s = 0; s < settings.samplesPerPixel; ++s) {
            const physics::Ray ray = camera.GetRay(i, j, rng);
            sum += RayColor(ray, world, settings.maxDepth, settings.background, rng);
        }
        return sum * camera.GetPixelSampleScale();
    }

    Framebuffer Renderer::Render(const physics::Hittable& world, const Camera& camera)
    {
        const int width = camera.GetImageWidth();
        const int height = camera.GetImageHeight();
        Framebuffer framebuffer(width, height);

        PT_LOG_INFO("Rendering {}x{} ({} spp, depth {}) on {} threads",
                    width, height, camera.GetSettings().samplesPerPixel, camera.GetSettings().maxDepth,
                    m_pool.GetThreadCount());

        HighResolutionTimer timer;
        timer.Start();

        std::vector<std::future<double>> rows;
        rows.reserve(height);

        for (int j = 0; j < height; ++j) {
            rows.push_back(m_pool.Submit(TaskPriority::NORMAL, [&world, &camera, &framebuffer, width, j]() {
                HighResolutionTimer rowTimer;
                rowTimer.Start();
                // cada tarefa escreve apenas na sua própria linha
                for (int i = 0; i < width; ++i)
                    framebuffer.At(i, j) = SamplePixel(camera, world, i, j);
                rowTimer.End();
                return rowTimer.GetElapsedMilliseconds();
            }));
        }

        // todas as linhas terminam antes de relançar a primeira falha
        m_scanlineTimes = TimerSampler();
        std::exception_ptr failure;
        const int step = height >= 10 ? height / 10 : 1;
        for (int j = 0; j < height; ++j) {
            try {
                m_scanlineTimes.AddSample(rows[j].get());
            } catch (const std::exception& e) {
                PT_LOG_ERROR("Scanline {} failed: {}", j, e.what());
                if (!failure)
                    failure = std::current_exception();
            }
            if ((j + 1) % step == 0)
                PT_LOG_DEBUG("Scanlines done: {}/{}", j + 1, height);
        }

        if (failure)
            std::rethrow_exception(failure);

        timer.End();
        m_lastRenderSeconds = timer.GetElapsedSeconds();

        PT_LOG_SUCCESS("Render finished in {:.3f} s", m_lastRenderSeconds);
        PT_LOG_DEBUG("{}", m_scanlineTimes.Summary("Scanline"));

        return framebuffer;
    }
}
