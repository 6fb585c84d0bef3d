#ifndef MESH_HPP
#define MESH_HPP

#include <vector>
#include <array>
#include <memory>
#include <string>
#include <cstdint>

typedef std::vector< std::array<float, 3> > Point3DList;
typedef std::vector< std::array<uint32_t, 3> > Index3DList;

struct Mesh {
    Point3DList vertices;
    Point3DList colour; // r, g, b in [0,1], per vertex, no alpha
    Index3DList faces;

    std::string name;

    bool hasColour() const { return colour.size()!=0; }

    /**
     * @brief append concatenate another mesh, face indices of 'other' are
     * shifted by the current vertex count
     */
    void append(const Mesh &other);

    /**
     * @brief centroid mean of all vertex positions
     */
    std::array<float, 3> centroid() const;

    /**
     * @brief extents axis-aligned bounding box size along x, y, z
     */
    std::array<float, 3> extents() const;

    /**
     * @brief normalise move the centroid to the origin and scale uniformly
     * such that the largest extent is 1
     * @throws DegenerateMeshError if the mesh has no vertices or zero extent
     */
    void normalise();

    /**
     * @brief faceNormals unit normal per face from the vertex winding,
     * zero for faces without area
     */
    Point3DList faceNormals() const;

    // neutral colour for geometry without colour information
    static constexpr float default_grey = 102.0f/255.0f;
};

typedef std::shared_ptr<Mesh> MeshPtr;

#endif // MESH_HPP
