#include "pt_api/graphics/texture.hpp"

#include <cmath>
#include <cstdint>

namespace pt_api {

    // --- CheckerTexture --- //

    CheckerTexture::CheckerTexture(double scale, std::shared_ptr<Texture> even, std::shared_ptr<Texture> odd)
        : m_invScale(1.0 / scale), m_even(std::move(even)), m_odd(std::move(odd))
    {
    }

    CheckerTexture::CheckerTexture(double scale, const Color& even, const Color& odd)
        : CheckerTexture(scale, std::make_shared<SolidColor>(even), std::make_shared<SolidColor>(odd))
    {
    }

    Color CheckerTexture::Value(double u, double v, const Point3& p) const
    {
        const int64_t x = static_cast<int64_t>(std::floor(m_invScale * p.x));
        const int64_t y = static_cast<int64_t>(std::floor(m_invScale * p.y));
        const int64_t z = static_cast<int64_t>(std::floor(m_invScale * p.z));

        const bool isEven = ((x + y + z) & 1) == 0;
        return isEven ? m_even->Value(u, v, p) : m_odd->Value(u, v, p);
    }

    // --- ImageTexture --- //

    Color ImageTexture::Value(double u, double v, const Point3&) const
    {
        if (m_image.Empty())
            return Color(0.0, 1.0, 1.0);

        u = math::Clamp(u, 0.0, 1.0);
        v = 1.0 - math::Clamp(v, 0.0, 1.0);

        const int i = static_cast<int>(u * m_image.GetWidth());
        const int j = static_cast<int>(v * m_image.GetHeight());
        const uint8_t* pixel = m_image.PixelData(i, j);

        constexpr double colorScale = 1.0 / 255.0;
        return Color(colorScale * pixel[0], colorScale * pixel[1], colorScale * pixel[2]);
    }

    // --- NoiseTexture --- //

    Color NoiseTexture::Value(double, double, const Point3& p) const
    {
        return Color(0.5) * (1.0 + std::sin(m_scale * p.z + 10.0 * m_noise.Turbulence(p)));
    }
}
