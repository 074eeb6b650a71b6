#pragma once

#include <memory>
#include "pt_api/core/math.hpp"
#include "pt_api/physics/ray.hpp"
#include "pt_api/physics/hittable.hpp"

namespace pt_api {
    class Random;
    class Texture;

    struct ScatterRecord {
        Color attenuation{ 0.0 };
        physics::Ray scattered;
    };

    /**
     * @brief Resposta da superfície: como a luz é espalhada e emitida num hit.
     *
     * Imutável; compartilhado entre primitivas e workers.
     */
    class Material {
    public:
        virtual ~Material() = default;

        /**
         * @brief Amostra um raio de saída.
         * @return false quando o caminho é absorvido.
         */
        virtual bool Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const {
            (void)in; (void)rec; (void)out; (void)rng;
            return false;
        }

        virtual Color Emitted(double u, double v, const Point3& p) const {
            (void)u; (void)v; (void)p;
            return Color(0.0);
        }
    };

    /// Superfície difusa, espalhamento ponderado pelo cosseno.
    class Lambertian : public Material {
    public:
        explicit Lambertian(const Color& albedo);
        explicit Lambertian(std::shared_ptr<Texture> texture) : m_texture(std::move(texture)) {}

        bool Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const override;

    private:
        std::shared_ptr<Texture> m_texture;
    };

    /// Reflexão especular perturbada por fuzz em [0, 1].
    class Metal : public Material {
    public:
        Metal(const Color& albedo, double fuzz) : m_albedo(albedo), m_fuzz(fuzz < 1.0 ? fuzz : 1.0) {}

        bool Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const override;

        double GetFuzz() const { return m_fuzz; }

    private:
        Color m_albedo;
        double m_fuzz;
    };

    /**
     * @brief Material refrativo transparente (vidro, água).
     *
     * Reflete na reflexão interna total ou com a probabilidade de Schlick;
     * senão refrata. Nunca absorve.
     */
    class Dielectric : public Material {
    public:
        explicit Dielectric(double refractionIndex) : m_refractionIndex(refractionIndex) {}

        bool Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const override;

        /// Aproximação de Schlick para a refletância de Fresnel.
        static double Reflectance(double cosine, double refractionIndex);

        double GetRefractionIndex() const { return m_refractionIndex; }

    private:
        // relativo ao meio envolvente
        double m_refractionIndex;
    };

    class DiffuseLight : public Material {
    public:
        explicit DiffuseLight(const Color& emit);
        explicit DiffuseLight(std::shared_ptr<Texture> texture) : m_texture(std::move(texture)) {}

        Color Emitted(double u, double v, const Point3& p) const override;

    private:
        std::shared_ptr<Texture> m_texture;
    };

    /// Função de fase de um meio participante: uniforme na esfera.
    class Isotropic : public Material {
    public:
        explicit Isotropic(const Color& albedo);
        explicit Isotropic(std::shared_ptr<Texture> texture) : m_texture(std::move(texture)) {}

        bool Scatter(const physics::Ray& in, const physics::HitRecord& rec, ScatterRecord& out, Random& rng) const override;

    private:
        std::shared_ptr<Texture> m_texture;
    };
}
