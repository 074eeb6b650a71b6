#pragma once

#include <memory>
#include "pt_api/core/math.hpp"
#include "pt_api/graphics/image.hpp"
#include "pt_api/graphics/perlin.hpp"

namespace pt_api {

    /**
     * @brief Cor num ponto da superfície.
     */
    class Texture {
    public:
        virtual ~Texture() = default;

        /**
         * @param u,v Coordenadas de superfície do hit.
         * @param p Ponto do hit no espaço do mundo.
         */
        virtual Color Value(double u, double v, const Point3& p) const = 0;
    };

    class SolidColor : public Texture {
    public:
        explicit SolidColor(const Color& albedo) : m_albedo(albedo) {}
        SolidColor(double r, double g, double b) : m_albedo(r, g, b) {}

        Color Value(double, double, const Point3&) const override { return m_albedo; }

    private:
        Color m_albedo;
    };

    /**
     * @brief Xadrez 3D: a paridade da soma de floor(p / scale) nos eixos escolhe o filho.
     */
    class CheckerTexture : public Texture {
    public:
        CheckerTexture(double scale, std::shared_ptr<Texture> even, std::shared_ptr<Texture> odd);
        CheckerTexture(double scale, const Color& even, const Color& odd);

        Color Value(double u, double v, const Point3& p) const override;

    private:
        double m_invScale;
        std::shared_ptr<Texture> m_even;
        std::shared_ptr<Texture> m_odd;
    };

    /**
     * @brief Amostra uma imagem decodificada por (u, v); v = 1 é a linha do topo.
     *
     * Retorna ciano quando a imagem está vazia.
     */
    class ImageTexture : public Texture {
    public:
        explicit ImageTexture(Image image) : m_image(std::move(image)) {}

        Color Value(double u, double v, const Point3& p) const override;

        const Image& GetImage() const { return m_image; }

    private:
        Image m_image;
    };

    /**
     * @brief Mármore: seno ao longo de z defasado pela turbulência.
     */
    class NoiseTexture : public Texture {
    public:
        NoiseTexture(double scale, Random& rng) : m_noise(rng), m_scale(scale) {}

        Color Value(double u, double v, const Point3& p) const override;

    private:
        Perlin m_noise;
        double m_scale;
    };
}
