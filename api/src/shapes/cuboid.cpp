#include "pt_api/shapes/cuboid.hpp"
#include "pt_api/shapes/quad.hpp"

#include <algorithm>

namespace pt_api::shapes {

    Cuboid::Cuboid(const Point3& a, const Point3& b, std::shared_ptr<Material> material)
    {
        const Point3 min(std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z));
        const Point3 max(std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z));

        const Vec3 dx(max.x - min.x, 0.0, 0.0);
        const Vec3 dy(0.0, max.y - min.y, 0.0);
        const Vec3 dz(0.0, 0.0, max.z - min.z);

        m_faces.Add(std::make_shared<Quad>(Point3(min.x, min.y, max.z),  dx,  dy, material)); // frente
        m_faces.Add(std::make_shared<Quad>(Point3(max.x, min.y, max.z), -dz,  dy, material)); // direita
        m_faces.Add(std::make_shared<Quad>(Point3(max.x, min.y, min.z), -dx,  dy, material)); // trás
        m_faces.Add(std::make_shared<Quad>(Point3(min.x, min.y, min.z),  dz,  dy, material)); // esquerda
        m_faces.Add(std::make_shared<Quad>(Point3(min.x, max.y, max.z),  dx, -dz, material)); // topo
        m_faces.Add(std::make_shared<Quad>(Point3(min.x, min.y, min.z),  dx,  dz, material)); // base
    }
}
