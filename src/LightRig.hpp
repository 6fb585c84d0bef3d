#ifndef LIGHTRIG_HPP
#define LIGHTRIG_HPP

#include <string>
#include <vector>

#include <Eigen/Geometry>

struct DirectionalLight {
    std::string name;
    Eigen::Matrix4d pose;
    Eigen::Vector3d colour;
    double intensity;

    /**
     * @brief direction world direction the light travels in, the negative Z axis of its pose
     */
    Eigen::Vector3d direction() const;

    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

typedef std::vector<DirectionalLight, Eigen::aligned_allocator<DirectionalLight>> LightRig;

namespace LightRigBuilder {

/**
 * @brief enhancedRig key, fill, back-rim and two side lights, oriented by look-at towards the origin
 */
LightRig enhancedRig();

/**
 * @brief basicRig three equally strong lights with fixed poses
 */
LightRig basicRig();

}

#endif // LIGHTRIG_HPP
