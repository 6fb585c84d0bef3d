#include "SceneConfig.hpp"

#include <stdexcept>

Eigen::Matrix4d CameraConfig::pose() const {
    Eigen::Matrix4d T = Eigen::Matrix4d::Identity();
    T(2, 3) = distance;
    return T;
}

SceneConfig SceneConfig::forMode(const RenderMode mode, const int img_size) {
    if(img_size<0)
        throw std::invalid_argument("image size must not be negative, got "+std::to_string(img_size));

    SceneConfig config;
    config.mode = mode;

    switch(mode) {
    case RenderMode::Basic:
        config.img_size = 512;
        config.default_views = 6;
        config.camera.distance = 1.5;
        config.background = Eigen::Vector4d(1, 1, 1, 0);
        config.lights = LightRigBuilder::basicRig();
        break;
    case RenderMode::Enhanced:
        config.img_size = 768;
        config.default_views = 12;
        config.camera.distance = 1.8;
        config.background = Eigen::Vector4d(1, 1, 1, 1);
        config.lights = LightRigBuilder::enhancedRig();
        break;
    }

    if(img_size>0)
        config.img_size = img_size;

    return config;
}

RenderMode parseRenderMode(const std::string &name) {
    if(name=="basic")
        return RenderMode::Basic;
    if(name=="enhanced")
        return RenderMode::Enhanced;
    throw std::invalid_argument("unknown render mode '"+name+"', expected 'basic' or 'enhanced'");
}

std::string renderModeName(const RenderMode mode) {
    return mode==RenderMode::Basic ? "basic" : "enhanced";
}
