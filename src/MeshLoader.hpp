#ifndef MESHLOADER_HPP
#define MESHLOADER_HPP

#include <string>
#include <vector>

#include "Mesh.hpp"

namespace MeshLoader {

/**
 * @brief getSubMeshes read all meshes of an asset container in file order
 * @throws UnsupportedAssetError if the container cannot be read, holds no
 * mesh or a mesh with non-triangular faces
 */
std::vector<MeshPtr> getSubMeshes(const std::string &path);

/**
 * @brief mergeMeshes concatenate meshes into a single triangle mesh
 */
MeshPtr mergeMeshes(const std::vector<MeshPtr> &meshes);

MeshPtr getMesh(const std::string &path);

/**
 * @brief getNormalisedMesh merged mesh, centred at the origin with largest extent 1
 * @throws DegenerateMeshError for meshes with zero extent
 */
MeshPtr getNormalisedMesh(const std::string &path);

}

#endif // MESHLOADER_HPP
