#include "test_common.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <pt_api/containers/bvh.hpp>
#include <pt_api/core/debug.hpp>
#include <pt_api/core/filesystem.hpp>
#include <pt_api/core/random.hpp>
#include <pt_api/core/threadPool.hpp>
#include <pt_api/graphics/material.hpp>
#include <pt_api/graphics/renderer.hpp>
#include <pt_api/scene/sceneLoader.hpp>
#include <pt_api/framework.hpp>
#include <pt_api/shapes/quad.hpp>
#include <pt_api/shapes/sphere.hpp>

namespace {
    // large square in the z = 0 plane, facing +z
    std::shared_ptr<pt_api::shapes::Quad> wall(std::shared_ptr<pt_api::Material> material) {
        using namespace pt_api;
        return std::make_shared<shapes::Quad>(Point3(-50.0, -50.0, 0.0), Vec3(100.0, 0.0, 0.0), Vec3(0.0, 100.0, 0.0), material);
    }

    pt_api::CameraSettings small_view() {
        pt_api::CameraSettings settings;
        settings.imageWidth = 20;
        settings.samplesPerPixel = 1;
        settings.maxDepth = 1;
        settings.lookFrom = pt_api::Point3(0.0, 0.0, 3.0);
        settings.lookAt = pt_api::Point3(0.0);
        settings.seed = 42;
        return settings;
    }
}

void test_ray_color() {
    using namespace pt_api;
    using physics::Ray;

    printf("Test ray color          | ");

    Random rng(2);
    const Ray towardWall(Point3(0.0, 0.0, 5.0), Vec3(0.0, 0.0, -1.0));
    const Color background(0.7, 0.8, 1.0);

    { // nothing to hit
        const physics::HittableList empty;
        require(approx_equal(Renderer::RayColor(towardWall, empty, 10, background, rng), background, 1e-12));
    }
    { // a light contributes its emission and stops the path
        physics::HittableList world(wall(std::make_shared<DiffuseLight>(Color(4.0, 3.0, 2.0))));
        require(approx_equal(Renderer::RayColor(towardWall, world, 10, background, rng), Color(4.0, 3.0, 2.0), 1e-12));
        // emission is collected even when no scatter is allowed
        require(approx_equal(Renderer::RayColor(towardWall, world, 0, background, rng), Color(4.0, 3.0, 2.0), 1e-12));
    }
    { // depth 0 stops at the first surface, depth 1 lets the bounce escape to the sky
        physics::HittableList world(wall(std::make_shared<Lambertian>(Color(0.5))));
        require(approx_equal(Renderer::RayColor(towardWall, world, 0, background, rng), Color(0.0), 1e-12));
        for (int i = 0; i < 20; ++i) {
            require(approx_equal(Renderer::RayColor(towardWall, world, 1, background, rng), 0.5 * background, 1e-12));
        }
    }
    { // a black background leaves only emitted light
        physics::HittableList world(wall(std::make_shared<Lambertian>(Color(0.5))));
        require(approx_equal(Renderer::RayColor(towardWall, world, 5, Color(0.0), rng), Color(0.0), 1e-12));
    }
    { // a mirror shows what is behind the viewer
        physics::HittableList world;
        world.Add(wall(std::make_shared<Metal>(Color(0.9), 0.0)));
        world.Add(std::make_shared<shapes::Quad>(Point3(-50.0, -50.0, 10.0), Vec3(100.0, 0.0, 0.0), Vec3(0.0, 100.0, 0.0),
                                                  std::make_shared<DiffuseLight>(Color(2.0))));
        require(approx_equal(Renderer::RayColor(towardWall, world, 1, background, rng), Color(1.8), 1e-12));
        // one bounce short: the light is never reached
        require(approx_equal(Renderer::RayColor(towardWall, world, 0, background, rng), Color(0.0), 1e-12));
    }

    printf("OK\n");
}

void test_framebuffer() {
    using namespace pt_api;

    printf("Test framebuffer        | ");

    { // gamma 2 and byte quantization
        require(Framebuffer::LinearToGamma(0.25) == Approx(0.5, 1e-12));
        require(Framebuffer::LinearToGamma(-1.0) == 0.0);
        require(Framebuffer::ToByte(0.0) == 0);
        require(Framebuffer::ToByte(0.25) == 128);
        require(Framebuffer::ToByte(1.0) == 255);
        require(Framebuffer::ToByte(50.0) == 255);
        require(Framebuffer::ToByte(-3.0) == 0);
    }
    { // layout is row-major, top row first
        Framebuffer fb(2, 1);
        fb.At(0, 0) = Color(1.0, 0.0, 0.25);
        fb.At(1, 0) = Color(0.0, 1.0, 0.0);
        const std::vector<uint8_t> rgb = fb.ToRGB8();
        require(rgb == std::vector<uint8_t>({ 255, 0, 128, 0, 255, 0 }));

        const std::filesystem::path path = std::filesystem::temp_directory_path() / "pt_api_test_framebuffer.ppm";
        fb.WritePPM(path);

        const std::vector<uint8_t> bytes = filesystem::ReadBytes(path);
        const std::string header = "P6\n2 1\n255\n";
        require_fatal(bytes.size() == header.size() + rgb.size());
        require(std::string(bytes.begin(), bytes.begin() + header.size()) == header);
        require(std::vector<uint8_t>(bytes.begin() + header.size(), bytes.end()) == rgb);

        // the encoder output is readable by the texture decoder
        const Image image = Image::LoadPPM(path);
        require(image.GetWidth() == 2 && image.GetHeight() == 1);
        require(image.GetData() == rgb);

        std::filesystem::remove(path);
    }
    { // unwritable destination
        const Framebuffer fb(1, 1);
        require_throws(fb.WritePPM("/nonexistent/pt_api/out.ppm"));
    }

    printf("OK\n");
}

void test_render_end_to_end() {
    using namespace pt_api;

    printf("Test render end to end  | ");

    physics::HittableList world(std::make_shared<shapes::Sphere>(Point3(0.0), 1.0, std::make_shared<Lambertian>(Color(0.5))));
    const CameraSettings settings = small_view();
    const Camera camera(settings);

    ThreadPool pool(2);
    Renderer renderer(pool);
    const Framebuffer fb = renderer.Render(world, camera);

    require_fatal(fb.GetWidth() == 20 && fb.GetHeight() == 20);
    require(renderer.GetScanlineTimes().GetSampleCount() == 20);
    require(renderer.GetLastRenderSeconds() >= 0.0);

    // the sphere is convex: one bounce always escapes to the sky
    const Color center = fb.At(10, 10);
    require(approx_equal(center, 0.5 * settings.background, 1e-9));

    // the corner ray passes well clear of the sphere
    const Color corner = fb.At(0, 0);
    require(approx_equal(corner, settings.background, 1e-12));

    // and a render is a pure function of the scene and the seed
    const Framebuffer again = renderer.Render(world, camera);
    require(again.GetPixels() == fb.GetPixels());

    printf("OK\n");
}

void test_render_thread_independence() {
    using namespace pt_api;

    printf("Test render threads     | ");

    Random sceneRng(99);
    std::vector<std::shared_ptr<physics::Hittable>> objects;
    objects.push_back(std::make_shared<shapes::Sphere>(Point3(0.0, -1000.0, 0.0), 999.0, std::make_shared<Lambertian>(Color(0.5))));
    objects.push_back(std::make_shared<shapes::Sphere>(Point3(-1.2, 0.0, 0.0), 0.5, std::make_shared<Dielectric>(1.5)));
    objects.push_back(std::make_shared<shapes::Sphere>(Point3(0.0, 0.0, 0.0), 0.5, std::make_shared<Metal>(Color(0.8, 0.6, 0.2), 0.3)));
    objects.push_back(std::make_shared<shapes::Sphere>(Point3(1.2, 0.0, 0.0), Point3(1.2, 0.3, 0.0), 0.5,
                                                       std::make_shared<Lambertian>(Color(0.1, 0.2, 0.5))));
    objects.push_back(std::make_shared<shapes::Quad>(Point3(-1.0, 2.0, -1.0), Vec3(2.0, 0.0, 0.0), Vec3(0.0, 0.0, 2.0),
                                                     std::make_shared<DiffuseLight>(Color(3.0))));
    const BVHNode world(objects, sceneRng);

    CameraSettings settings = small_view();
    settings.imageWidth = 16;
    settings.samplesPerPixel = 4;
    settings.maxDepth = 6;
    settings.defocusAngle = 2.0;
    settings.focusDistance = 3.0;
    const Camera camera(settings);

    ThreadPool single(1);
    ThreadPool many(4);
    Renderer a(single), b(many);
    const Framebuffer fa = a.Render(world, camera);
    const Framebuffer fb = b.Render(world, camera);

    require(fa.GetPixels() == fb.GetPixels());

    bool lit = false;
    for (const Color &c : fa.GetPixels()) {
        require(c.r >= 0.0 && c.g >= 0.0 && c.b >= 0.0);
        lit |= c.r > 0.0;
    }
    require(lit);

    // a different seed gives a different image
    settings.seed = 7;
    const Framebuffer other = a.Render(world, Camera(settings));
    require(other.GetPixels() != fa.GetPixels());

    printf("OK\n");
}

void test_framework() {
    using namespace pt_api;

    printf("Test framework          | ");

    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "pt_api_test_framework";
    std::filesystem::create_directories(dir);

    const std::string text = R"({
        "render": { "threads": 2, "log_level": "error" },
        "camera": { "image_width": 8, "samples_per_pixel": 2, "max_depth": 3,
                    "look_from": [0, 0, 3], "look_at": [0, 0, 0] },
        "objects": [
            { "type": "sphere", "center": [0, 0, 0], "radius": 1,
              "material": { "type": "lambertian", "albedo": [0.5, 0.5, 0.5] } }
        ]
    })";
    filesystem::WriteBytes(dir / "tiny.json", std::vector<uint8_t>(text.begin(), text.end()));

    { // run before init
        Framework framework;
        require_throws(framework.Run(dir / "never.ppm"));
        require_throws(framework.GetScene());
    }
    { // full pipeline, the scene's thread count overridden
        Framework framework;
        framework.Init(dir / "tiny.json", 3);
        require(framework.GetScene().name == "tiny");

        framework.Run(dir / "tiny.ppm");
        const Framebuffer &fb = framework.GetFramebuffer();
        require(fb.GetWidth() == 8 && fb.GetHeight() == 8);

        const Image written = Image::LoadPPM(dir / "tiny.ppm");
        require(written.GetWidth() == 8 && written.GetHeight() == 8);
        require(written.GetData() == fb.ToRGB8());
    }
    { // an empty scene renders as plain background
        const std::string empty = R"({ "render": { "log_level": "error" }, "camera": { "image_width": 4 }, "objects": [] })";
        filesystem::WriteBytes(dir / "empty.json", std::vector<uint8_t>(empty.begin(), empty.end()));

        Framework framework;
        framework.Init(dir / "empty.json", 1);
        framework.Run(dir / "empty.ppm");
        for (const Color &c : framework.GetFramebuffer().GetPixels()) {
            require(approx_equal(c, CameraSettings().background, 1e-12));
        }
    }

    { // render log written next to the scene, console restored afterwards
        const std::string logged = R"({ "render": { "threads": 1, "log_level": "info", "log_file": "logs/../render.log" },
                                         "camera": { "image_width": 4 }, "objects": [] })";
        filesystem::WriteBytes(dir / "logged.json", std::vector<uint8_t>(logged.begin(), logged.end()));
        {
            Framework framework;
            framework.Init(dir / "logged.json");
            framework.Run(dir / "logged.ppm");
        }
        Debug::SetMinimumLevel(LogLevel::Error);

        require_fatal(filesystem::FileExists(dir / "render.log"));
        const std::string text = filesystem::ReadText(dir / "render.log");
        require(text.find("Render finished") != std::string::npos);
        require(text.find("Camera 4x4") != std::string::npos);

        // once the framework is gone nothing else reaches the file
        const size_t size = text.size();
        Debug::Print(LogLevel::Info, "console output restored");
        require(filesystem::ReadText(dir / "render.log").size() == size);
    }

    std::filesystem::remove_all(dir);
    Debug::SetMinimumLevel(LogLevel::Error);

    printf("OK\n");
}
