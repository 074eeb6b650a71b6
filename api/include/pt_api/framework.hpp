#pragma once

#include "core/diagnostics.hpp"
#include "graphics/image.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace pt_api {
    class ThreadPool;
    class Camera;
    class Renderer;
    struct Scene;
    namespace physics { class Hittable; }

    /**
     * @brief Carrega uma cena, renderiza e grava a imagem.
     */
    class Framework {
    public:
        Framework();
        ~Framework();

        /**
         * @brief Carrega a cena e prepara a hierarquia, a câmera e os workers.
         * @param scenePath Arquivo JSON da cena.
         * @param threadOverride Número de workers; 0 mantém o valor da cena.
         */
        void Init(const std::filesystem::path& scenePath, size_t threadOverride = 0);

        /**
         * @brief Renderiza e grava um PPM binário.
         * @param outputPath Arquivo de saída; vazio grava "<nome da cena>.ppm" no diretório atual.
         */
        void Run(const std::filesystem::path& outputPath = {});

        const Framebuffer& GetFramebuffer() const { return m_framebuffer; }
        const Scene& GetScene() const;

    private:
        bool m_isInitialized = false;
        bool m_logToFile = false;
        std::unique_ptr<Scene> m_scene;
        std::shared_ptr<physics::Hittable> m_world;
        std::unique_ptr<Camera> m_camera;
        std::unique_ptr<ThreadPool> m_threadPool;
        std::unique_ptr<Renderer> m_renderer;
        Framebuffer m_framebuffer;
    };
} // namespace pt_api
