#include "pt_api/framework.hpp"
#include "pt_api/core/debug.hpp"
#include "pt_api/core/threadPool.hpp"
#include "pt_api/core/random.hpp"
#include "pt_api/containers/bvh.hpp"
#include "pt_api/graphics/camera.hpp"
#include "pt_api/graphics/renderer.hpp"
#include "pt_api/scene/sceneLoader.hpp"

#include <thread>
#include <algorithm>

namespace pt_api {
    Framework::Framework() {
        PT_LOG_DEBUG("Framework constructed.");
    }

    Framework::~Framework() {
        // os workers terminam antes da cena ser destruída
        if (m_threadPool)
            m_threadPool->Shutdown();
        PT_LOG_DEBUG("Framework destructed.");
        if (m_logToFile)
            Debug::ResetOutputToConsole();
    }

    void Framework::Init(const std::filesystem::path& scenePath, size_t threadOverride) {
        m_scene = std::make_unique<Scene>(SceneLoader::LoadFromFile(scenePath));
        Debug::SetMinimumLevel(m_scene->logLevel);
        Debug::SetAutoFlush(m_scene->logAutoFlush);
        if (!m_scene->logFile.empty()) {
            Debug::SetLogFile(m_scene->logFile.string());
            m_logToFile = true;
            PT_LOG_INFO("Logging scene '{}' to {}", m_scene->name, m_scene->logFile.string());
        }

        // --- Hierarquia --- //
        HighResolutionTimer timer;
        timer.Start();

        if (m_scene->objects.Empty()) {
            PT_LOG_WARN("Scene '{}' has no objects; every pixel will be background", m_scene->name);
            m_world = std::make_shared<physics::HittableList>(m_scene->objects);
        } else {
            Random buildRng(m_scene->seed);
            auto bvh = std::make_shared<BVHNode>(m_scene->objects.Objects(), buildRng);
            timer.End();
            PT_LOG_INFO("BVH built over {} objects: {} nodes, depth {} ({:.2f} ms)",
                        m_scene->objects.Size(), bvh->GetNodeCount(), bvh->GetDepth(), timer.GetElapsedMilliseconds());
            PT_LOG_DEBUG("BVH bounds {} - {}",
                         math::ToString(bvh->BoundingBox().Min()), math::ToString(bvh->BoundingBox().Max()));
            m_world = std::move(bvh);
        }

        m_camera = std::make_unique<Camera>(m_scene->camera);

        size_t threads = threadOverride != 0 ? threadOverride : m_scene->threads;
        if (threads == 0)
            threads = std::max(1u, std::thread::hardware_concurrency());

        m_threadPool = std::make_unique<ThreadPool>(threads);
        m_renderer = std::make_unique<Renderer>(*m_threadPool);

        PT_LOG_INFO("Camera {}x{}, {} spp, max depth {}, {} threads",
                    m_camera->GetImageWidth(), m_camera->GetImageHeight(),
                    m_scene->camera.samplesPerPixel, m_scene->camera.maxDepth, m_threadPool->GetThreadCount());
        PT_LOG_DEBUG("Camera at {} looking at {}",
                     math::ToString(m_scene->camera.lookFrom), math::ToString(m_scene->camera.lookAt));
        PT_LOG_SUCCESS("Framework initialized.");
        m_isInitialized = true;
    }

    void Framework::Run(const std::filesystem::path& outputPath) {
        if (!m_isInitialized)
            PT_LOG_THROW("Framework not initialized. Call Init() before Run().");

        m_framebuffer = m_renderer->Render(*m_world, *m_camera);

        const std::filesystem::path target = outputPath.empty()
            ? std::filesystem::path(m_scene->name + ".ppm")
            : outputPath;
        m_framebuffer.WritePPM(target);

        const TimerSampler& rows = m_renderer->GetScanlineTimes();
        PT_LOG_INFO("Output: {} ({}x{}), {}", target.string(), m_framebuffer.GetWidth(), m_framebuffer.GetHeight(),
                    rows.Summary("scanline"));
    }

    const Scene& Framework::GetScene() const {
        if (!m_scene)
            PT_LOG_THROW("Framework not initialized. Call Init() before GetScene().");
        return *m_scene;
    }
} // namespace pt_api
