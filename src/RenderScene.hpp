#ifndef RENDERSCENE_HPP
#define RENDERSCENE_HPP

#include <memory>

#include <pangolin/gl/glsl.h>
#include <pangolin/pangolin.h>

#include "Mesh.hpp"
#include "MeshBuffers.hpp"
#include "SceneConfig.hpp"

/**
 * @brief RenderScene, one mesh node, a fixed camera and the light rig of a session
 * Needs a current OpenGL context for its whole lifetime.
 */
class RenderScene {
public:
    /**
     * @throws RenderFailure if the shader cannot be built
     */
    RenderScene(const Mesh &mesh, const SceneConfig &config);

    ~RenderScene();

    RenderScene(const RenderScene &) = delete;
    RenderScene& operator=(const RenderScene &) = delete;

    /**
     * @brief setMeshPose model matrix of the mesh node, the camera never moves
     */
    void setMeshPose(const Eigen::Matrix4d &pose);

    void render();

    /**
     * @brief clear remove mesh node and release its buffers
     */
    void clear();

    static pangolin::OpenGlMatrix toOpenGl(const Eigen::Matrix4d &T);

private:
    void setupLights();

    const SceneConfig config;

    pangolin::GlSlProgram shader;

    std::unique_ptr<MeshBuffers> mesh_node;
    pangolin::OpenGlMatrix mesh_pose;

    pangolin::OpenGlRenderState camera;
};

#endif // RENDERSCENE_HPP
