#include "MeshLoader.hpp"
#include "Errors.hpp"

#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>
#include <assimp/material.h>

#include <iostream>

namespace MeshLoader {

std::vector<MeshPtr> getSubMeshes(const std::string &path) {
    Assimp::Importer importer;

    // node transforms are not applied, meshes are used as stored in the container
    const unsigned int flags = aiProcess_Triangulate;

    const aiScene* scene = importer.ReadFile(path, flags);

    if(!scene) {
        throw UnsupportedAssetError("import error '"+path+"': "+importer.GetErrorString());
    }

    const unsigned int nMeshes = scene->mNumMeshes;

    if(nMeshes==0) {
        throw UnsupportedAssetError("no mesh in '"+path+"'");
    }

    std::cout<<"meshes: "<<nMeshes<<std::endl;

    std::vector<MeshPtr> meshes;

    for(unsigned int iMesh(0); iMesh<nMeshes; iMesh++) {
        const aiMesh *aimesh = scene->mMeshes[iMesh];

        const unsigned int nVerts = aimesh->mNumVertices;
        const unsigned int nFaces = aimesh->mNumFaces;

        MeshPtr mesh = std::make_shared<Mesh>();
        mesh->name = aimesh->mName.C_Str();
        mesh->vertices.resize(nVerts);
        mesh->faces.resize(nFaces);

        std::cout<<"name: "<<mesh->name<<", verts: "<<nVerts<<", faces: "<<nFaces<<std::endl;

        // material diffuse colour, used if there are no vertex colours
        aiColor4D diffuse;
        const bool has_diffuse = (aimesh->mColors[0]==NULL) && scene->HasMaterials() &&
                aiGetMaterialColor(scene->mMaterials[aimesh->mMaterialIndex], AI_MATKEY_COLOR_DIFFUSE, &diffuse)==AI_SUCCESS;

        if(aimesh->mColors[0]!=NULL || has_diffuse)
            mesh->colour.resize(nVerts);

        for(unsigned int i = 0; i<nVerts; i++) {
            // vertices
            mesh->vertices[i] = {aimesh->mVertices[i].x, aimesh->mVertices[i].y, aimesh->mVertices[i].z};

            // colour, r, g, b
            if(aimesh->mColors[0]!=NULL)
                mesh->colour[i] = {aimesh->mColors[0][i].r, aimesh->mColors[0][i].g, aimesh->mColors[0][i].b};
            else if(has_diffuse)
                mesh->colour[i] = {diffuse.r, diffuse.g, diffuse.b};
        }

        for(unsigned int i = 0; i<nFaces; i++) {
            const aiFace &face = aimesh->mFaces[i];

            // only accept triangulated meshes
            if(face.mNumIndices!=3) {
                throw UnsupportedAssetError("mesh '"+mesh->name+"' in '"+path+"' has a face with "+
                                            std::to_string(face.mNumIndices)+" indices");
            }

            mesh->faces[i] = {face.mIndices[0], face.mIndices[1], face.mIndices[2]};
        }

        meshes.push_back(mesh);
    } // for all nMeshes

    return meshes;
}

MeshPtr mergeMeshes(const std::vector<MeshPtr> &meshes) {
    if(meshes.size()==1)
        return meshes[0];

    MeshPtr merged = std::make_shared<Mesh>();
    for(const MeshPtr &m : meshes) {
        merged->append(*m);
        merged->name += merged->name.empty() ? m->name : "+"+m->name;
    }
    return merged;
}

MeshPtr getMesh(const std::string &path) {
    const MeshPtr mesh = mergeMeshes(getSubMeshes(path));
    std::cout<<"merged verts: "<<mesh->vertices.size()<<", faces: "<<mesh->faces.size()<<std::endl;
    return mesh;
}

MeshPtr getNormalisedMesh(const std::string &path) {
    MeshPtr mesh = getMesh(path);
    mesh->normalise();
    return mesh;
}

} // namespace MeshLoader
