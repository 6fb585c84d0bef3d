#ifndef MESHBUFFERS_HPP
#define MESHBUFFERS_HPP

#include <pangolin/gl/gl.h>
#include <pangolin/gl/glsl.h>

#include "Mesh.hpp"

/**
 * @brief MeshBuffers, OpenGL buffers of a mesh for flat shading
 * Every face gets its own three vertices with the face normal. Buffers must be
 * created and destroyed while the OpenGL context is current.
 */
class MeshBuffers {
public:
    /**
     * @brief renderSetup initialise OpenGL buffer and upload mesh data
     */
    void renderSetup(const Mesh &mesh);

    void render(pangolin::GlSlProgram &shader);

private:
    pangolin::GlBuffer vertexbuffer;
    pangolin::GlBuffer normalbuffer;
    pangolin::GlBuffer colourbuffer;
};

#endif // MESHBUFFERS_HPP
