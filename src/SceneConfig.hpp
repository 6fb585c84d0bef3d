#ifndef SCENECONFIG_HPP
#define SCENECONFIG_HPP

#include <string>
#include <cmath>

#include <Eigen/Geometry>

#include "LightRig.hpp"

enum class RenderMode { Basic, Enhanced };

/**
 * @brief CameraConfig, perspective camera on the +Z axis looking at the origin
 * The camera is never moved between views.
 */
struct CameraConfig {
    double yfov = M_PI/3.0;  // vertical field of view (rad)
    double distance = 1.8;   // eye position on +Z
    double z_near = 0.05;
    double z_far = 100;

    Eigen::Matrix4d pose() const;
};

/**
 * @brief SceneConfig, everything needed to set up a render session
 * Built once per invocation and passed down, never shared between sessions.
 */
struct SceneConfig {
    RenderMode mode = RenderMode::Enhanced;
    int img_size = 768;
    int default_views = 12;
    CameraConfig camera;
    Eigen::Vector4d background = Eigen::Vector4d::Ones(); // r, g, b, a
    LightRig lights;

    /**
     * @brief forMode preset of the given mode, 'img_size' of 0 selects the mode's default size
     * @throws std::invalid_argument for negative image sizes
     */
    static SceneConfig forMode(const RenderMode mode, const int img_size = 0);

    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

/**
 * @brief parseRenderMode "basic" or "enhanced"
 * @throws std::invalid_argument for any other name
 */
RenderMode parseRenderMode(const std::string &name);

std::string renderModeName(const RenderMode mode);

#endif // SCENECONFIG_HPP
