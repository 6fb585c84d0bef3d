#include "MeshBuffers.hpp"

void MeshBuffers::renderSetup(const Mesh &mesh) {
    const Point3DList face_normals = mesh.faceNormals();
    const std::array<float, 3> grey = {Mesh::default_grey, Mesh::default_grey, Mesh::default_grey};

    // unshared vertices, one normal per face
    Point3DList vertices, normals, colour;
    vertices.reserve(mesh.faces.size()*3);
    normals.reserve(mesh.faces.size()*3);
    colour.reserve(mesh.faces.size()*3);
    for(size_t i = 0; i<mesh.faces.size(); i++) {
        for(const uint32_t v : mesh.faces[i]) {
            vertices.push_back(mesh.vertices[v]);
            normals.push_back(face_normals[i]);
            colour.push_back(mesh.hasColour() ? mesh.colour[v] : grey);
        }
    }

    //// create buffers
    // vertices
    vertexbuffer.Reinitialise(pangolin::GlArrayBuffer, vertices.size(), GL_FLOAT, 3, GL_STATIC_DRAW);
    vertexbuffer.Upload(vertices.data(), sizeof(float)*vertices.size()*3);

    // normals
    normalbuffer.Reinitialise(pangolin::GlArrayBuffer, normals.size(), GL_FLOAT, 3, GL_STATIC_DRAW);
    normalbuffer.Upload(normals.data(), sizeof(float)*normals.size()*3);

    // colour
    colourbuffer.Reinitialise(pangolin::GlArrayBuffer, colour.size(), GL_FLOAT, 3, GL_STATIC_DRAW);
    colourbuffer.Upload(colour.data(), sizeof(float)*colour.size()*3);
}

void MeshBuffers::render(pangolin::GlSlProgram &shader) {
    shader.Bind();

    colourbuffer.Bind();
    glColorPointer(colourbuffer.count_per_element, colourbuffer.datatype, 0, 0);
    glEnableClientState(GL_COLOR_ARRAY);

    normalbuffer.Bind();
    glNormalPointer(normalbuffer.datatype, 0, 0);
    glEnableClientState(GL_NORMAL_ARRAY);

    vertexbuffer.Bind();
    glVertexPointer(vertexbuffer.count_per_element, vertexbuffer.datatype, 0, 0);
    glEnableClientState(GL_VERTEX_ARRAY);

    glDrawArrays(GL_TRIANGLES, 0, vertexbuffer.num_elements);

    glDisableClientState(GL_VERTEX_ARRAY);
    vertexbuffer.Unbind();

    glDisableClientState(GL_NORMAL_ARRAY);
    normalbuffer.Unbind();

    glDisableClientState(GL_COLOR_ARRAY);
    colourbuffer.Unbind();

    shader.Unbind();
}
