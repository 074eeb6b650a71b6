#pragma once

#include <string>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "pt_api/core/debug.hpp"
#include "pt_api/core/random.hpp"
#include "pt_api/physics/hittable.hpp"
#include "pt_api/graphics/camera.hpp"

namespace pt_api {
    class Texture;
    class Material;

    /**
     * @brief Tudo o que uma renderização precisa, lido de um arquivo de cena.
     */
    struct Scene {
        std::string name = "render";
        uint64_t seed = 42;
        size_t threads = 0;                 // 0 = hardware concurrency
        LogLevel logLevel = LogLevel::Info;
        std::filesystem::path logFile;      // vazio = console
        bool logAutoFlush = true;
        CameraSettings camera;
        physics::HittableList objects;
    };

    /**
     * @brief Monta uma Scene a partir da descrição JSON.
     *
     * Texturas e materiais podem ser declarados por nome em "textures" e
     * "materials" e compartilhados por referência, ou escritos no próprio uso.
     * Valores inválidos ou ausentes são logados e lançados como
     * std::runtime_error antes da renderização.
     */
    class SceneLoader {
    public:
        /// Lê um arquivo de cena. Caminhos de imagem e de log são relativos ao diretório do arquivo.
        static Scene LoadFromFile(const std::filesystem::path& path);

        static Scene LoadFromJson(const nlohmann::json& root, const std::filesystem::path& baseDir = {});

        // profundidade máxima de translate/rotate/list/constant_medium aninhados
        static constexpr int MAX_NESTING = 64;

    private:
        SceneLoader(const nlohmann::json& root, std::filesystem::path baseDir, uint64_t seed);

        Scene build();

        void parseRender(Scene& scene) const;
        void parseCamera(CameraSettings& settings) const;

        std::shared_ptr<Texture> resolveTexture(const nlohmann::json& j, const std::string& where);
        std::shared_ptr<Texture> namedTexture(const std::string& name);
        std::shared_ptr<Texture> buildTexture(const nlohmann::json& j, const std::string& where);

        std::shared_ptr<Material> resolveMaterial(const nlohmann::json& j, const std::string& where);
        std::shared_ptr<Material> namedMaterial(const std::string& name);
        std::shared_ptr<Material> buildMaterial(const nlohmann::json& j, const std::string& where);

        std::shared_ptr<physics::Hittable> buildObject(const nlohmann::json& j, const std::string& where, int depth);

        // Texture given as "texture" or as a plain color under colorKey
        std::shared_ptr<Texture> textureOrColor(const nlohmann::json& j, const char* colorKey, const std::string& where);

    private:
        const nlohmann::json& m_root;
        std::filesystem::path m_baseDir;
        Random m_rng;

        std::unordered_map<std::string, std::shared_ptr<Texture>> m_textures;
        std::unordered_map<std::string, std::shared_ptr<Material>> m_materials;
        std::unordered_set<std::string> m_resolving;    // detecta referências cíclicas
    };
}
