#include "RenderScene.hpp"
#include "Errors.hpp"

#include <pangolin/display/display.h>

#include <cmath>

#ifndef MULTIVIEWRENDER_SHADER_DIR
#define MULTIVIEWRENDER_SHADER_DIR "shaders"
#endif

namespace {

// must match MAX_LIGHTS in the fragment shader
const size_t max_lights = 8;

pangolin::OpenGlMatrix cameraProjection(const SceneConfig &config) {
    const double size = config.img_size;
    // focal length in pixels for the vertical field of view
    const double f = (size/2.0)/std::tan(config.camera.yfov/2.0);
    return pangolin::ProjectionMatrix(size, size, f, f, size/2.0, size/2.0,
                                      config.camera.z_near, config.camera.z_far);
}

}

RenderScene::RenderScene(const Mesh &mesh, const SceneConfig &config)
    : config(config),
      // view matrix is the inverse camera pose
      camera(cameraProjection(config), toOpenGl(config.camera.pose().inverse()))
{
    if(config.lights.size()>max_lights)
        throw RenderFailure("too many lights: "+std::to_string(config.lights.size()));

    // load and compile shaders
    const std::string shader_dir = MULTIVIEWRENDER_SHADER_DIR;
    if(!shader.AddShaderFromFile(pangolin::GlSlVertexShader, shader_dir+"/MeshVertexShader.vert") ||
       !shader.AddShaderFromFile(pangolin::GlSlFragmentShader, shader_dir+"/MeshFragmentShader.frag") ||
       !shader.Link())
    {
        throw RenderFailure("cannot build mesh shader from '"+shader_dir+"'");
    }

    setupLights();

    // setup opengl buffers for mesh
    mesh_node.reset(new MeshBuffers());
    mesh_node->renderSetup(mesh);
    mesh_pose.SetIdentity();
}

RenderScene::~RenderScene() {
    clear();
}

void RenderScene::setupLights() {
    shader.Bind();
    shader.SetUniform("num_lights", int(config.lights.size()));
    for(size_t i = 0; i<config.lights.size(); i++) {
        const std::string id = "["+std::to_string(i)+"]";
        const Eigen::Vector3d d = config.lights[i].direction();
        const Eigen::Vector3d c = config.lights[i].colour;
        shader.SetUniform("light_direction"+id, float(d.x()), float(d.y()), float(d.z()));
        shader.SetUniform("light_colour"+id, float(c.x()), float(c.y()), float(c.z()));
        shader.SetUniform("light_intensity"+id, float(config.lights[i].intensity));
    }
    shader.Unbind();
}

void RenderScene::setMeshPose(const Eigen::Matrix4d &pose) {
    mesh_pose = toOpenGl(pose);
}

void RenderScene::render() {
    if(!mesh_node)
        return;

    shader.Bind();
    shader.SetUniform("MVP", camera.GetProjectionModelViewMatrix());
    shader.SetUniform("M", mesh_pose);
    shader.Unbind();

    mesh_node->render(shader);
}

void RenderScene::clear() {
    mesh_node.reset();
}

pangolin::OpenGlMatrix RenderScene::toOpenGl(const Eigen::Matrix4d &T) {
    pangolin::OpenGlMatrix M;
    for(int r(0); r<4; r++) {
        for(int c(0); c<4; c++) {
            M(r, c) = T(r, c);
        }
    }
    return M;
}
