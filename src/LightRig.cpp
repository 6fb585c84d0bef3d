#include "LightRig.hpp"
#include "ViewTable.hpp"

Eigen::Vector3d DirectionalLight::direction() const {
    return -pose.block<3,1>(0,2).normalized();
}

namespace LightRigBuilder {

namespace {

DirectionalLight makeLight(const std::string &name, const double intensity, const Eigen::Matrix4d &pose) {
    DirectionalLight light;
    light.name = name;
    light.pose = pose;
    light.colour = Eigen::Vector3d::Ones();
    light.intensity = intensity;
    return light;
}

DirectionalLight lightTowardsOrigin(const std::string &name, const double intensity, const Eigen::Vector3d &position) {
    return makeLight(name, intensity, ViewTable::lookAt(position, Eigen::Vector3d::Zero(), Eigen::Vector3d::UnitY()));
}

} // namespace

LightRig enhancedRig() {
    LightRig rig;
    rig.push_back(lightTowardsOrigin("key", 3.0, Eigen::Vector3d(2, 3, 2)));
    rig.push_back(lightTowardsOrigin("fill", 1.5, Eigen::Vector3d(-2, 2, -1)));
    rig.push_back(lightTowardsOrigin("back", 1.0, Eigen::Vector3d(0, 1, -3)));
    rig.push_back(lightTowardsOrigin("side_right", 0.8, Eigen::Vector3d(3, 0, 0)));
    rig.push_back(lightTowardsOrigin("side_left", 0.8, Eigen::Vector3d(-3, 0, 0)));
    return rig;
}

LightRig basicRig() {
    Eigen::Matrix4d top;
    top << 1, 0,  0, 0,
           0, 0, -1, 0,
           0, 1,  0, 2,
           0, 0,  0, 1;

    Eigen::Matrix4d side;
    side <<  0, 0, 1, -2,
             0, 1, 0,  2,
            -1, 0, 0,  2,
             0, 0, 0,  1;

    LightRig rig;
    rig.push_back(makeLight("front", 2.0, Eigen::Matrix4d::Identity()));
    rig.push_back(makeLight("top", 2.0, top));
    rig.push_back(makeLight("side", 2.0, side));
    return rig;
}

} // namespace LightRigBuilder
