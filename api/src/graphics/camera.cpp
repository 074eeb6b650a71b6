#include "pt_api/graphics/camera.hpp"
#include "pt_api/core/random.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pt_api {

    Camera::Camera(const CameraSettings& settings)
        : m_settings(settings)
    {
        if (settings.imageWidth <= 0)
            throw std::invalid_argument("Camera image width must be positive");
        if (settings.samplesPerPixel <= 0)
            throw std::invalid_argument("Camera samples per pixel must be positive");
        if (!(settings.aspectRatio > 0.0))
            throw std::invalid_argument("Camera aspect ratio must be positive");
        if (!(settings.verticalFov > 0.0 && settings.verticalFov < 180.0))
            throw std::invalid_argument("Camera vertical fov must be in (0, 180)");

        m_imageHeight = std::max(1, static_cast<int>(settings.imageWidth / settings.aspectRatio));
        m_pixelSampleScale = 1.0 / settings.samplesPerPixel;
        m_center = settings.lookFrom;

        const double theta = math::ToRadians(settings.verticalFov);
        const double h = std::tan(theta / 2.0);
        const double viewportHeight = 2.0 * h * settings.focusDistance;
        const double viewportWidth = viewportHeight * (static_cast<double>(settings.imageWidth) / m_imageHeight);

        m_w = math::Normalize(settings.lookFrom - settings.lookAt);
        m_u = math::Normalize(math::Cross(settings.viewUp, m_w));
        m_v = math::Cross(m_w, m_u);

        // u percorre a largura, v desce pela altura
        const Vec3 viewportU = viewportWidth * m_u;
        const Vec3 viewportV = viewportHeight * -m_v;

        m_pixelDeltaU = viewportU / static_cast<double>(settings.imageWidth);
        m_pixelDeltaV = viewportV / static_cast<double>(m_imageHeight);

        const Point3 viewportUpperLeft = m_center - settings.focusDistance * m_w - viewportU / 2.0 - viewportV / 2.0;
        m_pixel00 = viewportUpperLeft + 0.5 * (m_pixelDeltaU + m_pixelDeltaV);

        const double defocusRadius = settings.focusDistance * std::tan(math::ToRadians(settings.defocusAngle / 2.0));
        m_defocusDiskU = m_u * defocusRadius;
        m_defocusDiskV = -m_v * defocusRadius;
    }

    physics::Ray Camera::GetRay(int i, int j, Random& rng) const
    {
        const double offsetX = rng.Uniform() - 0.5;
        const double offsetY = rng.Uniform() - 0.5;

        const Point3 pixelSample = m_pixel00
                                 + (i + offsetX) * m_pixelDeltaU
                                 + (j + offsetY) * m_pixelDeltaV;

        const Point3 origin = m_settings.defocusAngle <= 0.0 ? m_center : defocusDiskSample(rng);
        const double time = rng.Uniform();

        return physics::Ray(origin, pixelSample - origin, time);
    }

    Point3 Camera::defocusDiskSample(Random& rng) const
    {
        const Vec3 p = rng.InUnitDisk();
        return m_center + p.x * m_defocusDiskU + p.y * m_defocusDiskV;
    }
}
