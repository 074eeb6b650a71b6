#include "test_common.h"

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <pt_api/core/filesystem.hpp>
#include <pt_api/graphics/camera.hpp>
#include <pt_api/graphics/material.hpp>
#include <pt_api/scene/sceneLoader.hpp>
#include <pt_api/shapes/constantMedium.hpp>
#include <pt_api/shapes/cuboid.hpp>
#include <pt_api/shapes/instance.hpp>
#include <pt_api/shapes/quad.hpp>
#include <pt_api/shapes/sphere.hpp>

using nlohmann::json;

namespace {
    const char *FullScene = R"({
        "seed": 7,
        "render": { "threads": 3, "log_level": "warn" },
        "camera": {
            "aspect_ratio": 2.0,
            "image_width": 64,
            "samples_per_pixel": 8,
            "max_depth": 4,
            "vertical_fov": 40,
            "look_from": [13, 2, 3],
            "look_at": [0, 0, 0],
            "view_up": [0, 1, 0],
            "defocus_angle": 0.6,
            "focus_distance": 10,
            "background": [0, 0, 0]
        },
        "textures": {
            "white": [0.73, 0.73, 0.73],
            "floor": { "type": "checker", "scale": 0.32, "even": "white", "odd": [0.2, 0.3, 0.1] },
            "marble": { "type": "noise", "scale": 4 }
        },
        "materials": {
            "ground": { "type": "lambertian", "texture": "floor" },
            "glass": { "type": "dielectric", "refraction_index": 1.5 },
            "gold": { "type": "metal", "albedo": [0.8, 0.6, 0.2], "fuzz": 2.0 },
            "lamp": { "type": "diffuse_light", "color": [15, 15, 15] },
            "alias": "glass",
            "unused": { "type": "lambertian", "albedo": [1, 0, 0] }
        },
        "objects": [
            { "type": "sphere", "center": [0, -1000, 0], "radius": 1000, "material": "ground" },
            { "type": "sphere", "center": [0, 1, 0], "radius": 1, "material": "glass" },
            { "type": "sphere", "center": [-4, 1, 0], "radius": 1, "material": "alias" },
            { "type": "sphere", "center": [4, 1, 0], "center2": [4, 1.5, 0], "radius": 1,
              "material": { "type": "lambertian", "texture": "marble" } },
            { "type": "quad", "q": [-1, 4, -1], "u": [2, 0, 0], "v": [0, 0, 2], "material": "lamp" },
            { "type": "translate", "offset": [2, 0, 0], "object":
                { "type": "rotate", "angles": [0, 15, 0], "object":
                    { "type": "box", "a": [0, 0, 0], "b": [1, 2, 1], "material": "gold" } } },
            { "type": "constant_medium", "density": 0.01, "color": [1, 1, 1],
              "boundary": { "type": "sphere", "center": [0, 0, 0], "radius": 50,
                            "material": { "type": "dielectric", "refraction_index": 1.5 } } },
            { "type": "list", "objects": [
                { "type": "sphere", "center": [0, 5, 0], "radius": 0.5, "material": "gold" },
                { "type": "sphere", "center": [0, 6, 0], "radius": 0.5, "material": "gold" }
            ] }
        ]
    })";

    // minimal valid scene with one object spliced in
    json with_object(const json &object) {
        json scene = json::parse(R"({ "objects": [] })");
        scene["objects"].push_back(object);
        return scene;
    }

    template<typename T>
    const T *object_as(const pt_api::Scene &scene, size_t index) {
        return dynamic_cast<const T *>(scene.objects.Objects().at(index).get());
    }
}

void test_scene_loader() {
    using namespace pt_api;

    printf("Test scene loader       | ");

    { // every section of a complete description
        const Scene scene = SceneLoader::LoadFromJson(json::parse(FullScene));

        require(scene.name == "render");
        require(scene.seed == 7);
        require(scene.threads == 3);
        require(scene.logLevel == LogLevel::Warn);

        const CameraSettings &cam = scene.camera;
        require(cam.aspectRatio == 2.0);
        require(cam.imageWidth == 64);
        require(cam.samplesPerPixel == 8);
        require(cam.maxDepth == 4);
        require(cam.verticalFov == 40.0);
        require(approx_equal(cam.lookFrom, Point3(13.0, 2.0, 3.0), 1e-12));
        require(approx_equal(cam.lookAt, Point3(0.0), 1e-12));
        require(cam.defocusAngle == Approx(0.6, 1e-12));
        require(cam.focusDistance == 10.0);
        require(approx_equal(cam.background, Color(0.0), 1e-12));
        require(cam.seed == 7);

        require_fatal(scene.objects.Size() == 8);

        const auto *ground = object_as<shapes::Sphere>(scene, 0);
        require_fatal(ground != nullptr);
        require(ground->GetRadius() == 1000.0);

        // named materials are shared, aliases resolve to the same instance
        const auto *glass = object_as<shapes::Sphere>(scene, 1);
        const auto *aliased = object_as<shapes::Sphere>(scene, 2);
        require_fatal(glass && aliased);
        require(glass->GetMaterial() == aliased->GetMaterial());
        require(dynamic_cast<const Dielectric *>(glass->GetMaterial().get()) != nullptr);

        const auto *moving = object_as<shapes::Sphere>(scene, 3);
        require_fatal(moving != nullptr);
        require(moving->IsMoving());
        require(approx_equal(moving->CenterAt(1.0), Point3(4.0, 1.5, 0.0), 1e-12));

        const auto *lamp = object_as<shapes::Quad>(scene, 4);
        require_fatal(lamp != nullptr);
        require(approx_equal(lamp->GetMaterial()->Emitted(0.0, 0.0, Point3(0.0)), Color(15.0), 1e-12));

        const auto *translated = object_as<shapes::Translated>(scene, 5);
        require_fatal(translated != nullptr);
        require(approx_equal(translated->GetOffset(), Vec3(2.0, 0.0, 0.0), 1e-12));
        const auto *rotated = dynamic_cast<const shapes::Rotated *>(translated->GetObject().get());
        require_fatal(rotated != nullptr);
        require(dynamic_cast<const shapes::Cuboid *>(rotated->GetObject().get()) != nullptr);

        // metal fuzz above 1 is clamped
        const auto *box = dynamic_cast<const shapes::Cuboid *>(rotated->GetObject().get());
        const auto *face = dynamic_cast<const shapes::Quad *>(box->GetFaces().Objects().front().get());
        require_fatal(face != nullptr);
        const auto *gold = dynamic_cast<const Metal *>(face->GetMaterial().get());
        require_fatal(gold != nullptr);
        require(gold->GetFuzz() == 1.0);

        const auto *medium = object_as<shapes::ConstantMedium>(scene, 6);
        require_fatal(medium != nullptr);
        require(medium->GetDensity() == Approx(0.01, 1e-12));

        const auto *list = object_as<physics::HittableList>(scene, 7);
        require_fatal(list != nullptr);
        require(list->Size() == 2);
    }
    { // defaults when optional sections are left out
        const Scene scene = SceneLoader::LoadFromJson(json::parse(R"({ "objects": [] })"));
        require(scene.seed == 42);
        require(scene.threads == 0);
        require(scene.logLevel == LogLevel::Info);
        require(scene.logFile.empty());
        require(scene.logAutoFlush);
        require(scene.objects.Empty());
        require(scene.camera.imageWidth == CameraSettings().imageWidth);
        require(approx_equal(scene.camera.background, CameraSettings().background, 1e-12));
    }
    { // log file resolves against the scene directory
        const std::filesystem::path base = std::filesystem::temp_directory_path() / "pt_api_scene_dir";
        const Scene scene = SceneLoader::LoadFromJson(
            json::parse(R"({ "render": { "log_file": "logs/../render.log", "log_auto_flush": false }, "objects": [] })"), base);
        require(scene.logFile == filesystem::NormalizePath(base / "render.log"));
        require(scene.logFile.is_absolute());
        require(!scene.logAutoFlush);
    }
    { // wrappers may nest up to the limit
        json nested = json::parse(R"({ "type": "sphere", "center": [0, 0, 0], "radius": 1,
                                       "material": { "type": "lambertian", "albedo": [0.5, 0.5, 0.5] } })");
        for (int i = 0; i < SceneLoader::MAX_NESTING; ++i) {
            json wrapper = i % 2 == 0 ? json::parse(R"({ "type": "translate", "offset": [0.1, 0, 0] })")
                                      : json::parse(R"({ "type": "rotate", "angles": [0, 5, 0] })");
            wrapper["object"] = std::move(nested);
            nested = std::move(wrapper);
        }
        json scene = json::parse(R"({ "objects": [] })");
        scene["objects"].push_back(nested);
        const Scene loaded = SceneLoader::LoadFromJson(scene);
        require(loaded.objects.Size() == 1);
        require(dynamic_cast<const shapes::Rotated *>(loaded.objects.Objects().front().get()) != nullptr);
    }
    { // from disk: name from the file stem, images relative to the scene file
        const std::filesystem::path dir = std::filesystem::temp_directory_path() / "pt_api_test_scene";
        std::filesystem::create_directories(dir);

        const std::string ppm = "P3\n1 1\n255\n255 128 0\n";
        filesystem::WriteBytes(dir / "tex.ppm", std::vector<uint8_t>(ppm.begin(), ppm.end()));

        const std::string text = R"({
            "objects": [ { "type": "sphere", "center": [0, 0, 0], "radius": 1,
                           "material": { "type": "lambertian", "texture": { "type": "image", "path": "tex.ppm" } } } ]
        })";
        filesystem::WriteBytes(dir / "earth.json", std::vector<uint8_t>(text.begin(), text.end()));

        const Scene scene = SceneLoader::LoadFromFile(dir / "earth.json");
        require(scene.name == "earth");
        require(scene.objects.Size() == 1);

        std::filesystem::remove_all(dir);
    }
    { // bundled scenes
        for (const char *name : { "spheres.json", "cornell_box.json", "fog.json" }) {
            const std::filesystem::path path = std::filesystem::path(PT_SCENES_DIR) / name;
            require_nothrow(SceneLoader::LoadFromFile(path));
        }
        const Scene cornell = SceneLoader::LoadFromFile(std::filesystem::path(PT_SCENES_DIR) / "cornell_box.json");
        require(cornell.name == "cornell_box");
        require(cornell.objects.Size() == 8);
        require_nothrow(Camera{cornell.camera});
    }

    printf("OK\n");
}

void test_scene_loader_errors() {
    using namespace pt_api;

    printf("Test scene loader errors| ");

    const json sphere = json::parse(R"({ "type": "sphere", "center": [0, 0, 0], "radius": 1,
                                         "material": { "type": "lambertian", "albedo": [0.5, 0.5, 0.5] } })");
    require_nothrow(SceneLoader::LoadFromJson(with_object(sphere)));

    { // structure
        require_throws(SceneLoader::LoadFromJson(json::parse("[]")));
        require_throws(SceneLoader::LoadFromJson(json::parse("{}")));
        require_throws(SceneLoader::LoadFromJson(json::parse(R"({ "objects": {} })")));
        require_throws(SceneLoader::LoadFromJson(json::parse(R"({ "objects": [], "materials": [] })")));
    }
    { // unknown types and missing or malformed fields
        json bad = sphere;
        bad["type"] = "torus";
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad.erase("radius");
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["center"] = json::parse("[0, 0]");
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["center"] = json::parse(R"([0, "a", 0])");
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["radius"] = -1.0;
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["material"]["type"] = "plastic";
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["material"] = json::parse(R"({ "type": "metal", "albedo": [1, 1, 1], "fuzz": -0.5 })");
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["material"] = json::parse(R"({ "type": "dielectric", "refraction_index": 0 })");
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));

        bad = sphere;
        bad["material"] = json::parse(R"({ "type": "diffuse_light" })");
        require_throws(SceneLoader::LoadFromJson(with_object(bad)));
    }
    { // other object kinds
        require_throws(SceneLoader::LoadFromJson(with_object(json::parse(
            R"({ "type": "quad", "q": [0, 0, 0], "u": [1, 0, 0], "v": [2, 0, 0], "material": { "type": "dielectric", "refraction_index": 1.5 } })"))));
        require_throws(SceneLoader::LoadFromJson(with_object(json::parse(R"({ "type": "list", "objects": [] })"))));
        require_throws(SceneLoader::LoadFromJson(with_object(json::parse(
            R"({ "type": "constant_medium", "density": -1, "color": [1, 1, 1], "boundary": { "type": "box", "a": [0, 0, 0], "b": [1, 1, 1], "material": { "type": "dielectric", "refraction_index": 1.5 } } })"))));
        require_throws(SceneLoader::LoadFromJson(with_object(json::parse(R"({ "type": "translate", "offset": [1, 1, 1] })"))));
    }
    { // nesting one level past the limit, through every wrapper kind
        json nested = sphere;
        for (int i = 0; i <= SceneLoader::MAX_NESTING; ++i) {
            json wrapper;
            switch (i % 4) {
                case 0: wrapper = json::parse(R"({ "type": "translate", "offset": [0, 0, 0] })"); wrapper["object"] = nested; break;
                case 1: wrapper = json::parse(R"({ "type": "rotate", "angles": [0, 0, 0] })"); wrapper["object"] = nested; break;
                case 2: wrapper = json::parse(R"({ "type": "list" })"); wrapper["objects"] = json::array({ nested }); break;
                default: wrapper = json::parse(R"({ "type": "constant_medium", "density": 1, "color": [1, 1, 1] })");
                         wrapper["boundary"] = nested; break;
            }
            nested = std::move(wrapper);
        }
        require_throws(SceneLoader::LoadFromJson(with_object(nested)));

        // a pathological chain is rejected long before the stack is at risk
        json chain = sphere;
        for (int i = 0; i < 5000; ++i) {
            json wrapper = json::parse(R"({ "type": "translate", "offset": [0, 0, 0] })");
            wrapper["object"] = std::move(chain);
            chain = std::move(wrapper);
        }
        require_throws(SceneLoader::LoadFromJson(with_object(chain)));
    }
    { // names
        json scene = with_object(sphere);
        scene["objects"][0]["material"] = "missing";
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["materials"] = json::parse(R"({ "loop": "loop" })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["materials"] = json::parse(R"({ "a": "b", "b": "a" })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["textures"] = json::parse(R"({ "c": { "type": "checker", "scale": 1, "even": "c", "odd": [0, 0, 0] } })");
        require_throws(SceneLoader::LoadFromJson(scene));

        // unused definitions are validated too
        scene = with_object(sphere);
        scene["textures"] = json::parse(R"({ "broken": { "type": "checker", "scale": 0, "even": [1, 1, 1], "odd": [0, 0, 0] } })");
        require_throws(SceneLoader::LoadFromJson(scene));
    }
    { // render and camera sections
        json scene = with_object(sphere);
        scene["render"] = json::parse(R"({ "log_level": "verbose" })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["render"] = json::parse(R"({ "threads": -2 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["seed"] = -1;
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "image_width": 0 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "samples_per_pixel": 2.5 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        // integers outside the int range are rejected instead of wrapped
        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "image_width": 4294967297 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "samples_per_pixel": 4294967297 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "max_depth": -4294967295 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "image_width": 18446744073709551615 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["render"] = json::parse(R"({ "log_auto_flush": "yes" })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "vertical_fov": 180 })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "look_from": [0, 0, 0], "look_at": [0, 0, 0] })");
        require_throws(SceneLoader::LoadFromJson(scene));

        scene = with_object(sphere);
        scene["camera"] = json::parse(R"({ "look_from": [0, 5, 0], "look_at": [0, 0, 0], "view_up": [0, 1, 0] })");
        require_throws(SceneLoader::LoadFromJson(scene));
    }
    { // files
        require_throws(SceneLoader::LoadFromFile("/nonexistent/pt_api/scene.json"));

        const std::filesystem::path path = std::filesystem::temp_directory_path() / "pt_api_test_malformed.json";
        const std::string text = R"({ "objects": [ )";
        filesystem::WriteBytes(path, std::vector<uint8_t>(text.begin(), text.end()));
        require_throws(SceneLoader::LoadFromFile(path));
        std::filesystem::remove(path);

        json scene = with_object(sphere);
        scene["objects"][0]["material"] = json::parse(
            R"({ "type": "lambertian", "texture": { "type": "image", "path": "does_not_exist.ppm" } })");
        require_throws(SceneLoader::LoadFromJson(scene, std::filesystem::temp_directory_path()));
    }

    printf("OK\n");
}
