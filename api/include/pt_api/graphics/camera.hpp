#pragma once

#include <cstdint>
#include "pt_api/core/math.hpp"
#include "pt_api/physics/ray.hpp"

namespace pt_api {
    class Random;

    struct CameraSettings {
        // Imagem
        double aspectRatio = 1.0;
        int imageWidth = 100;
        int samplesPerPixel = 10;
        int maxDepth = 10;          // scatter events followed per path

        // Vista
        double verticalFov = 90.0;  // graus
        Point3 lookFrom{ 0.0, 0.0, 0.0 };
        Point3 lookAt{ 0.0, 0.0, -1.0 };
        Vec3 viewUp{ 0.0, 1.0, 0.0 };

        // Desfoque
        double defocusAngle = 0.0;  // graus, 0 desliga a profundidade de campo
        double focusDistance = 10.0;

        Color background{ 0.7, 0.8, 1.0 };
        uint64_t seed = 42;
    };

    /**
     * @brief Câmera perspectiva de lente fina. Todo o estado é calculado na construção.
     */
    class Camera {
    public:
        /// @throws std::invalid_argument se largura, amostras, aspecto ou fov forem inválidos.
        explicit Camera(const CameraSettings& settings);

        /**
         * @brief Raio primário por um ponto aleatório do pixel (i, j).
         * @param i Coluna, 0 à esquerda.
         * @param j Linha, 0 no topo.
         */
        physics::Ray GetRay(int i, int j, Random& rng) const;

        const CameraSettings& GetSettings() const { return m_settings; }
        int GetImageWidth() const { return m_settings.imageWidth; }
        int GetImageHeight() const { return m_imageHeight; }
        double GetPixelSampleScale() const { return m_pixelSampleScale; }

        const Point3& GetCenter() const { return m_center; }
        const Point3& GetPixel00() const { return m_pixel00; }
        const Vec3& GetPixelDeltaU() const { return m_pixelDeltaU; }
        const Vec3& GetPixelDeltaV() const { return m_pixelDeltaV; }
        const Vec3& GetU() const { return m_u; }
        const Vec3& GetV() const { return m_v; }
        const Vec3& GetW() const { return m_w; }

    private:
        Point3 defocusDiskSample(Random& rng) const;

        CameraSettings m_settings;
        int m_imageHeight;
        double m_pixelSampleScale;

        Point3 m_center;
        Point3 m_pixel00;
        Vec3 m_pixelDeltaU;
        Vec3 m_pixelDeltaV;
        Vec3 m_u, m_v, m_w;     // base ortonormal
        Vec3 m_defocusDiskU;
        Vec3 m_defocusDiskV;
    };
}
