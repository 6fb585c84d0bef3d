#include "Mesh.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cmath>

void Mesh::append(const Mesh &other) {
    const uint32_t offset = vertices.size();

    // colour is either empty or per vertex, fill the uncoloured part with grey
    if(hasColour() || other.hasColour()) {
        const std::array<float, 3> grey = {default_grey, default_grey, default_grey};
        colour.resize(offset, grey);
        if(other.hasColour())
            colour.insert(colour.end(), other.colour.begin(), other.colour.end());
        else
            colour.resize(offset+other.vertices.size(), grey);
    }

    vertices.insert(vertices.end(), other.vertices.begin(), other.vertices.end());

    faces.reserve(faces.size()+other.faces.size());
    for(const std::array<uint32_t, 3> &f : other.faces) {
        faces.push_back({f[0]+offset, f[1]+offset, f[2]+offset});
    }
}

std::array<float, 3> Mesh::centroid() const {
    double sum[3] = {0, 0, 0};
    for(const std::array<float, 3> &v : vertices) {
        for(uint32_t d(0); d<3; d++)
            sum[d] += v[d];
    }
    const double n = std::max<size_t>(vertices.size(), 1);
    return {float(sum[0]/n), float(sum[1]/n), float(sum[2]/n)};
}

std::array<float, 3> Mesh::extents() const {
    if(vertices.empty())
        return {0, 0, 0};

    std::array<float, 3> vmin = vertices[0];
    std::array<float, 3> vmax = vertices[0];
    for(const std::array<float, 3> &v : vertices) {
        for(uint32_t d(0); d<3; d++) {
            vmin[d] = std::min(vmin[d], v[d]);
            vmax[d] = std::max(vmax[d], v[d]);
        }
    }
    return {vmax[0]-vmin[0], vmax[1]-vmin[1], vmax[2]-vmin[2]};
}

void Mesh::normalise() {
    if(vertices.empty())
        throw DegenerateMeshError("mesh '"+name+"' has no vertices");

    const std::array<float, 3> c = centroid();
    const std::array<float, 3> ext = extents();
    const float max_extent = *std::max_element(ext.begin(), ext.end());

    if(!(max_extent>0))
        throw DegenerateMeshError("mesh '"+name+"' has zero extent on all axes");

    // scale in double, 1/max_extent overflows float for very small meshes
    const double scale = 1.0/double(max_extent);
    if(!std::isfinite(scale))
        throw DegenerateMeshError("mesh '"+name+"' extent too small to rescale");

    for(std::array<float, 3> &v : vertices) {
        for(uint32_t d(0); d<3; d++)
            v[d] = float((double(v[d])-double(c[d]))*scale);
    }
}

Point3DList Mesh::faceNormals() const {
    Point3DList normals(faces.size(), {0, 0, 0});
    for(size_t i = 0; i<faces.size(); i++) {
        const std::array<float, 3> &a = vertices[faces[i][0]];
        const std::array<float, 3> &b = vertices[faces[i][1]];
        const std::array<float, 3> &c = vertices[faces[i][2]];
        const float u[3] = {b[0]-a[0], b[1]-a[1], b[2]-a[2]};
        const float w[3] = {c[0]-a[0], c[1]-a[1], c[2]-a[2]};
        const float n[3] = {u[1]*w[2]-u[2]*w[1], u[2]*w[0]-u[0]*w[2], u[0]*w[1]-u[1]*w[0]};
        const float len = std::sqrt(n[0]*n[0]+n[1]*n[1]+n[2]*n[2]);
        if(len>0)
            normals[i] = {n[0]/len, n[1]/len, n[2]/len};
    }
    return normals;
}
