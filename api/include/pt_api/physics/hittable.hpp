#pragma once

#include <memory>
#include <vector>
#include "pt_api/core/math.hpp"
#include "pt_api/core/interval.hpp"
#include "pt_api/physics/ray.hpp"
#include "pt_api/physics/aabb.hpp"

namespace pt_api {
    class Material;
    class Random;
}

namespace pt_api::physics {

    /**
     * @brief Resultado da interseção raio/superfície.
     */
    struct HitRecord {
        Point3 point;
        Vec3 normal;                        // always faces against the incoming ray
        double t = 0.0;
        double u = 0.0;
        double v = 0.0;
        bool frontFace = false;
        const Material* material = nullptr; // owned by the primitive that produced the hit

        void SetFaceNormal(const Ray& ray, const Vec3& outwardNormal) {
            frontFace = math::Dot(ray.dir, outwardNormal) < 0.0;
            normal = frontFace ? outwardNormal : -outwardNormal;
        }
    };

    /**
     * @brief Qualquer coisa que um raio pode atingir.
     *
     * Imutável após a construção; lido em paralelo por todos os workers.
     */
    class Hittable {
    public:
        virtual ~Hittable() = default;

        /**
         * @brief Interseção mais próxima com t dentro de range.
         * @param ray Raio testado.
         * @param range Valores válidos de t.
         * @param rec Preenchido apenas quando retorna true.
         * @param rng Random da amostra atual (usado pelos meios participantes).
         * @return true se algo foi atingido.
         */
        virtual bool Hit(const Ray& ray, const math::Interval& range, HitRecord& rec, Random& rng) const = 0;

        /// Caixa envolvente, calculada na construção.
        virtual AABB BoundingBox() const = 0;
    };

    /**
     * @brief Lista de primitivas percorrida linearmente.
     *
     * O intervalo de busca encolhe até o hit mais próximo encontrado.
     */
    class HittableList : public Hittable {
    public:
        HittableList() = default;
        explicit HittableList(std::shared_ptr<Hittable> object) { Add(std::move(object)); }

        void Add(std::shared_ptr<Hittable> object);
        void Clear() noexcept;

        size_t Size() const noexcept { return m_objects.size(); }
        bool Empty() const noexcept { return m_objects.empty(); }
        const std::vector<std::shared_ptr<Hittable>>& Objects() const noexcept { return m_objects; }

        bool Hit(const Ray& ray, const math::Interval& range, HitRecord& rec, Random& rng) const override;
        AABB BoundingBox() const override { return m_bbox; }

    private:
        std::vector<std::shared_ptr<Hittable>> m_objects;
        AABB m_bbox;
    };
}
