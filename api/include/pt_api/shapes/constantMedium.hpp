#pragma once

#include <memory>
#include "pt_api/physics/hittable.hpp"

namespace pt_api {
    class Material;
    class Texture;
}

namespace pt_api::shapes {

    /**
     * @brief Meio participante de densidade constante (névoa, fumaça) dentro de uma fronteira.
     *
     * A fronteira deve ser convexa: o meio fica entre a primeira e a segunda
     * interseção do raio com ela. A distância de espalhamento vem do Random de
     * quem chama. Normal e UV não têm significado; o material é sempre a
     * função de fase isotrópica.
     */
    class ConstantMedium : public physics::Hittable {
    public:
        ConstantMedium(std::shared_ptr<physics::Hittable> boundary, double density, std::shared_ptr<Texture> texture);
        ConstantMedium(std::shared_ptr<physics::Hittable> boundary, double density, const Color& albedo);

        bool Hit(const physics::Ray& ray, const math::Interval& range, physics::HitRecord& rec, Random& rng) const override;
        physics::AABB BoundingBox() const override { return m_boundary->BoundingBox(); }

        double GetDensity() const { return -1.0 / m_negInvDensity; }
        const Material& GetPhaseFunction() const { return *m_phaseFunction; }

    private:
        std::shared_ptr<physics::Hittable> m_boundary;
        double m_negInvDensity;
        std::shared_ptr<Material> m_phaseFunction;
    };
}
