#include "pt_api/scene/sceneLoader.hpp"
#include "pt_api/core/filesystem.hpp"
#include "pt_api/core/diagnostics.hpp"
#include "pt_api/graphics/texture.hpp"
#include "pt_api/graphics/material.hpp"
#include "pt_api/shapes/sphere.hpp"
#include "pt_api/shapes/quad.hpp"
#include "pt_api/shapes/cuboid.hpp"
#include "pt_api/shapes/constantMedium.hpp"
#include "pt_api/shapes/instance.hpp"

#include <cmath>
#include <limits>

using nlohmann::json;

namespace pt_api {

    namespace {
        // --- Leitura de campos --- //

        const json& required(const json& j, const char* key, const std::string& where) {
            if (!j.is_object())
                PT_LOG_THROW("{}: expected an object", where);
            const auto it = j.find(key);
            if (it == j.end())
                PT_LOG_THROW("{}: missing required field '{}'", where, key);
            return *it;
        }

        double toNumber(const json& v, const std::string& where) {
            if (!v.is_number())
                PT_LOG_THROW("{}: expected a number, got {}", where, v.dump());
            const double value = v.get<double>();
            if (!std::isfinite(value))
                PT_LOG_THROW("{}: value must be finite", where);
            return value;
        }

        double readNumber(const json& j, const char* key, const std::string& where) {
            return toNumber(required(j, key, where), fmt::format("{}.{}", where, key));
        }

        double numberOr(const json& j, const char* key, double fallback, const std::string& where) {
            return j.contains(key) ? readNumber(j, key, where) : fallback;
        }

        int64_t integerOr(const json& j, const char* key, int64_t fallback, const std::string& where) {
            if (!j.contains(key))
                return fallback;
            const json& v = j.at(key);
            if (!v.is_number_integer())
                PT_LOG_THROW("{}.{}: expected an integer, got {}", where, key, v.dump());
            if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                PT_LOG_THROW("{}.{}: {} is out of range", where, key, v.dump());
            return v.get<int64_t>();
        }

        int intOr(const json& j, const char* key, int fallback, const std::string& where) {
            const int64_t value = integerOr(j, key, fallback, where);
            if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
                PT_LOG_THROW("{}.{}: {} is out of range", where, key, value);
            return static_cast<int>(value);
        }

        bool boolOr(const json& j, const char* key, bool fallback, const std::string& where) {
            if (!j.contains(key))
                return fallback;
            const json& v = j.at(key);
            if (!v.is_boolean())
                PT_LOG_THROW("{}.{}: expected true or false, got {}", where, key, v.dump());
            return v.get<bool>();
        }

        Vec3 toVec3(const json& v, const std::string& where) {
            if (!v.is_array() || v.size() != 3)
                PT_LOG_THROW("{}: expected an array of 3 numbers, got {}", where, v.dump());
            return Vec3(toNumber(v[0], where), toNumber(v[1], where), toNumber(v[2], where));
        }

        Vec3 readVec3(const json& j, const char* key, const std::string& where) {
            return toVec3(required(j, key, where), fmt::format("{}.{}", where, key));
        }

        Vec3 vec3Or(const json& j, const char* key, const Vec3& fallback, const std::string& where) {
            return j.contains(key) ? readVec3(j, key, where) : fallback;
        }

        std::string readString(const json& j, const char* key, const std::string& where) {
            const json& v = required(j, key, where);
            if (!v.is_string())
                PT_LOG_THROW("{}.{}: expected a string, got {}", where, key, v.dump());
            return v.get<std::string>();
        }
    }

    // ------------------- API pública -------------------

    Scene SceneLoader::LoadFromFile(const std::filesystem::path& path)
    {
        HighResolutionTimer timer;
        timer.Start();

        if (!filesystem::FileExists(path))
            PT_LOG_THROW("Scene file not found: {}", filesystem::NormalizePath(path).string());

        const std::string text = filesystem::ReadText(path);

        json root;
        try {
            root = json::parse(text);
        } catch (const json::parse_error& e) {
            PT_LOG_THROW("Malformed scene file {}: {}", path.string(), e.what());
        }

        if (root.is_object() && !root.contains("name"))
            root["name"] = path.stem().string();

        Scene scene = LoadFromJson(root, path.parent_path());

        timer.End();
        PT_LOG_INFO("Loaded scene '{}' from {} in {:.2f} ms ({} top-level objects)",
                    scene.name, path.string(), timer.GetElapsedMilliseconds(), scene.objects.Size());
        return scene;
    }

    Scene SceneLoader::LoadFromJson(const json& root, const std::filesystem::path& baseDir)
    {
        if (!root.is_object())
            PT_LOG_THROW("Scene description must be a JSON object");

        const int64_t seed = integerOr(root, "seed", 42, "scene");
        if (seed < 0)
            PT_LOG_THROW("scene.seed must be non-negative, got {}", seed);

        try {
            SceneLoader loader(root, baseDir, static_cast<uint64_t>(seed));
            return loader.build();
        } catch (const json::exception& e) {
            PT_LOG_THROW("Invalid scene description: {}", e.what());
        }
    }

    // ------------------- Construção -------------------

    SceneLoader::SceneLoader(const json& root, std::filesystem::path baseDir, uint64_t seed)
        : m_root(root), m_baseDir(std::move(baseDir)), m_rng(seed)
    {
    }

    Scene SceneLoader::build()
    {
        Scene scene;
        scene.seed = static_cast<uint64_t>(integerOr(m_root, "seed", 42, "scene"));
        if (m_root.contains("name"))
            scene.name = readString(m_root, "name", "scene");

        parseRender(scene);
        parseCamera(scene.camera);
        scene.camera.seed = scene.seed;

        for (const char* section : { "textures", "materials" }) {
            if (m_root.contains(section) && !m_root.at(section).is_object())
                PT_LOG_THROW("scene.{}: expected an object mapping names to definitions", section);
        }

        const json& objects = required(m_root, "objects", "scene");
        if (!objects.is_array())
            PT_LOG_THROW("scene.objects: expected an array");

        for (size_t i = 0; i < objects.size(); ++i)
            scene.objects.Add(buildObject(objects[i], fmt::format("objects[{}]", i), 0));

        // Declared but unused definitions are still validated
        if (m_root.contains("textures"))
            for (const auto& entry : m_root.at("textures").items())
                namedTexture(entry.key());
        if (m_root.contains("materials"))
            for (const auto& entry : m_root.at("materials").items())
                namedMaterial(entry.key());

        PT_LOG_DEBUG("Scene '{}': {} textures, {} materials by name", scene.name, m_textures.size(), m_materials.size());
        return scene;
    }

    void SceneLoader::parseRender(Scene& scene) const
    {
        if (!m_root.contains("render"))
            return;

        const json& render = m_root.at("render");
        if (!render.is_object())
            PT_LOG_THROW("scene.render: expected an object");

        const int64_t threads = integerOr(render, "threads", 0, "render");
        if (threads < 0)
            PT_LOG_THROW("render.threads must be non-negative, got {}", threads);
        scene.threads = static_cast<size_t>(threads);

        if (render.contains("log_level"))
            scene.logLevel = Debug::ParseLevel(readString(render, "log_level", "render"));
        if (render.contains("log_file"))
            scene.logFile = filesystem::NormalizePath(m_baseDir / readString(render, "log_file", "render"));
        scene.logAutoFlush = boolOr(render, "log_auto_flush", true, "render");
    }

    void SceneLoader::parseCamera(CameraSettings& s) const
    {
        if (!m_root.contains("camera"))
            return;

        const json& cam = m_root.at("camera");
        const std::string where = "camera";
        if (!cam.is_object())
            PT_LOG_THROW("scene.camera: expected an object");

        s.aspectRatio = numberOr(cam, "aspect_ratio", s.aspectRatio, where);
        s.imageWidth = intOr(cam, "image_width", s.imageWidth, where);
        s.samplesPerPixel = intOr(cam, "samples_per_pixel", s.samplesPerPixel, where);
        s.maxDepth = intOr(cam, "max_depth", s.maxDepth, where);
        s.verticalFov = numberOr(cam, "vertical_fov", s.verticalFov, where);
        s.lookFrom = vec3Or(cam, "look_from", s.lookFrom, where);
        s.lookAt = vec3Or(cam, "look_at", s.lookAt, where);
        s.viewUp = vec3Or(cam, "view_up", s.viewUp, where);
        s.defocusAngle = numberOr(cam, "defocus_angle", s.defocusAngle, where);
        s.focusDistance = numberOr(cam, "focus_distance", s.focusDistance, where);
        s.background = vec3Or(cam, "background", s.background, where);

        if (s.aspectRatio <= 0.0)
            PT_LOG_THROW("camera.aspect_ratio must be positive, got {}", s.aspectRatio);
        if (s.imageWidth <= 0)
            PT_LOG_THROW("camera.image_width must be positive, got {}", s.imageWidth);
        if (s.samplesPerPixel <= 0)
            PT_LOG_THROW("camera.samples_per_pixel must be positive, got {}", s.samplesPerPixel);
        if (s.maxDepth < 0)
            PT_LOG_THROW("camera.max_depth must be non-negative, got {}", s.maxDepth);
        if (s.verticalFov <= 0.0 || s.verticalFov >= 180.0)
            PT_LOG_THROW("camera.vertical_fov must be in (0, 180), got {}", s.verticalFov);
        if (s.defocusAngle < 0.0)
            PT_LOG_THROW("camera.defocus_angle must be non-negative, got {}", s.defocusAngle);
        if (s.focusDistance <= 0.0)
            PT_LOG_THROW("camera.focus_distance must be positive, got {}", s.focusDistance);
        if (math::NearZero(s.lookFrom - s.lookAt))
            PT_LOG_THROW("camera.look_from and camera.look_at must differ");
        if (math::NearZero(math::Cross(s.viewUp, s.lookFrom - s.lookAt)))
            PT_LOG_THROW("camera.view_up must not be parallel to the view direction");
    }

    // ------------------- Texturas -------------------

    std::shared_ptr<Texture> SceneLoader::resolveTexture(const json& j, const std::string& where)
    {
        if (j.is_string())
            return namedTexture(j.get<std::string>());
        if (j.is_array())
            return std::make_shared<SolidColor>(toVec3(j, where));
        return buildTexture(j, where);
    }

    std::shared_ptr<Texture> SceneLoader::namedTexture(const std::string& name)
    {
        if (auto it = m_textures.find(name); it != m_textures.end())
            return it->second;

        const json* defs = m_root.contains("textures") ? &m_root.at("textures") : nullptr;
        if (!defs || !defs->contains(name))
            PT_LOG_THROW("Unknown texture '{}'", name);

        const std::string key = "texture:" + name;
        if (!m_resolving.insert(key).second)
            PT_LOG_THROW("Texture '{}' references itself", name);

        auto texture = resolveTexture(defs->at(name), fmt::format("textures.{}", name));
        m_resolving.erase(key);

        m_textures.emplace(name, texture);
        return texture;
    }

    std::shared_ptr<Texture> SceneLoader::buildTexture(const json& j, const std::string& where)
    {
        const std::string type = readString(j, "type", where);

        if (type == "solid")
            return std::make_shared<SolidColor>(readVec3(j, "color", where));

        if (type == "checker") {
            const double scale = readNumber(j, "scale", where);
            if (scale <= 0.0)
                PT_LOG_THROW("{}.scale must be positive, got {}", where, scale);
            auto even = resolveTexture(required(j, "even", where), where + ".even");
            auto odd = resolveTexture(required(j, "odd", where), where + ".odd");
            return std::make_shared<CheckerTexture>(scale, std::move(even), std::move(odd));
        }

        if (type == "image") {
            const std::filesystem::path path = filesystem::NormalizePath(m_baseDir / readString(j, "path", where));
            if (!filesystem::FileExists(path))
                PT_LOG_THROW("{}: image file not found: {}", where, path.string());
            return std::make_shared<ImageTexture>(Image::LoadPPM(path));
        }

        if (type == "noise")
            return std::make_shared<NoiseTexture>(numberOr(j, "scale", 1.0, where), m_rng);

        PT_LOG_THROW("{}: unknown texture type '{}'", where, type);
    }

    std::shared_ptr<Texture> SceneLoader::textureOrColor(const json& j, const char* colorKey, const std::string& where)
    {
        if (j.contains("texture"))
            return resolveTexture(j.at("texture"), where + ".texture");
        if (j.contains(colorKey))
            return std::make_shared<SolidColor>(readVec3(j, colorKey, where));
        PT_LOG_THROW("{}: needs either 'texture' or '{}'", where, colorKey);
    }

    // ------------------- Materiais -------------------

    std::shared_ptr<Material> SceneLoader::resolveMaterial(const json& j, const std::string& where)
    {
        if (j.is_string())
            return namedMaterial(j.get<std::string>());
        return buildMaterial(j, where);
    }

    std::shared_ptr<Material> SceneLoader::namedMaterial(const std::string& name)
    {
        if (auto it = m_materials.find(name); it != m_materials.end())
            return it->second;

        const json* defs = m_root.contains("materials") ? &m_root.at("materials") : nullptr;
        if (!defs || !defs->contains(name))
            PT_LOG_THROW("Unknown material '{}'", name);

        const std::string key = "material:" + name;
        if (!m_resolving.insert(key).second)
            PT_LOG_THROW("Material '{}' references itself", name);

        auto material = resolveMaterial(defs->at(name), fmt::format("materials.{}", name));
        m_resolving.erase(key);

        m_materials.emplace(name, material);
        return material;
    }

    std::shared_ptr<Material> SceneLoader::buildMaterial(const json& j, const std::string& where)
    {
        const std::string type = readString(j, "type", where);

        if (type == "lambertian")
            return std::make_shared<Lambertian>(textureOrColor(j, "albedo", where));

        if (type == "metal") {
            const double fuzz = numberOr(j, "fuzz", 0.0, where);
            if (fuzz < 0.0)
                PT_LOG_THROW("{}.fuzz must be non-negative, got {}", where, fuzz);
            return std::make_shared<Metal>(readVec3(j, "albedo", where), fuzz);
        }

        if (type == "dielectric") {
            const double ior = readNumber(j, "refraction_index", where);
            if (ior <= 0.0)
                PT_LOG_THROW("{}.refraction_index must be positive, got {}", where, ior);
            return std::make_shared<Dielectric>(ior);
        }

        if (type == "diffuse_light")
            return std::make_shared<DiffuseLight>(textureOrColor(j, "color", where));

        if (type == "isotropic")
            return std::make_shared<Isotropic>(textureOrColor(j, "color", where));

        PT_LOG_THROW("{}: unknown material type '{}'", where, type);
    }

    // ------------------- Objetos -------------------

    std::shared_ptr<physics::Hittable> SceneLoader::buildObject(const json& j, const std::string& where, int depth)
    {
        if (depth > MAX_NESTING)
            PT_LOG_THROW("{}: nesting deeper than {}", where, MAX_NESTING);

        const std::string type = readString(j, "type", where);

        if (type == "sphere") {
            const Point3 center = readVec3(j, "center", where);
            const double radius = readNumber(j, "radius", where);
            if (radius <= 0.0)
                PT_LOG_THROW("{}.radius must be positive, got {}", where, radius);
            auto material = resolveMaterial(required(j, "material", where), where + ".material");

            if (j.contains("center2"))
                return std::make_shared<shapes::Sphere>(center, readVec3(j, "center2", where), radius, std::move(material));
            return std::make_shared<shapes::Sphere>(center, radius, std::move(material));
        }

        if (type == "quad") {
            const Point3 q = readVec3(j, "q", where);
            const Vec3 u = readVec3(j, "u", where);
            const Vec3 v = readVec3(j, "v", where);
            if (math::NearZero(math::Cross(u, v)))
                PT_LOG_THROW("{}: edges u and v must not be parallel", where);
            auto material = resolveMaterial(required(j, "material", where), where + ".material");
            return std::make_shared<shapes::Quad>(q, u, v, std::move(material));
        }

        if (type == "box") {
            const Point3 a = readVec3(j, "a", where);
            const Point3 b = readVec3(j, "b", where);
            auto material = resolveMaterial(required(j, "material", where), where + ".material");
            return std::make_shared<shapes::Cuboid>(a, b, std::move(material));
        }

        if (type == "constant_medium") {
            auto boundary = buildObject(required(j, "boundary", where), where + ".boundary", depth + 1);
            const double density = readNumber(j, "density", where);
            if (density < 0.0)
                PT_LOG_THROW("{}.density must be non-negative, got {}", where, density);
            return std::make_shared<shapes::ConstantMedium>(std::move(boundary), density, textureOrColor(j, "color", where));
        }

        if (type == "translate") {
            const Vec3 offset = readVec3(j, "offset", where);
            return std::make_shared<shapes::Translated>(buildObject(required(j, "object", where), where + ".object", depth + 1), offset);
        }

        if (type == "rotate") {
            const Vec3 angles = readVec3(j, "angles", where);
            return std::make_shared<shapes::Rotated>(buildObject(required(j, "object", where), where + ".object", depth + 1), angles);
        }

        if (type == "list") {
            const json& children = required(j, "objects", where);
            if (!children.is_array() || children.empty())
                PT_LOG_THROW("{}.objects: expected a non-empty array", where);

            auto list = std::make_shared<physics::HittableList>();
            for (size_t i = 0; i < children.size(); ++i)
                list->Add(buildObject(children[i], fmt::format("{}.objects[{}]", where, i), depth + 1));
            return list;
        }

        PT_LOG_THROW("{}: unknown object type '{}'", where, type);
    }
}
