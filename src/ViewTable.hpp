#ifndef VIEWTABLE_HPP
#define VIEWTABLE_HPP

#include <string>
#include <vector>
#include <variant>

#include <Eigen/Geometry>

/**
 * @brief ViewSpec, object rotation for a single rendered view
 * The index defines render and file name order.
 */
struct ViewSpec {
    int index;
    std::string label;
    Eigen::Matrix4d rotation;   // rigid transform without translation

    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

typedef std::vector<ViewSpec, Eigen::aligned_allocator<ViewSpec>> ViewList;

// view table algorithms
struct CubeCorners { };
struct Strategic12 { };
struct UniformFan { int n; };

typedef std::variant<CubeCorners, Strategic12, UniformFan> ViewTableStrategy;

namespace ViewTable {

/**
 * @brief rotationMatrix 4x4 rotation by 'angle' (rad) about 'axis'
 */
Eigen::Matrix4d rotationMatrix(const double angle, const Eigen::Vector3d &axis);

/**
 * @brief rotationFromVectors rotation that maps the direction of 'a' onto the direction of 'b'
 * For antiparallel vectors this is a half turn about an axis orthogonal to 'a',
 * the choice of axis is arbitrary.
 * @throws std::invalid_argument for zero-length vectors
 */
Eigen::Matrix4d rotationFromVectors(const Eigen::Vector3d &a, const Eigen::Vector3d &b);

/**
 * @brief lookAt pose with rotation rows [right; up; -forward] and translation 'eye'
 */
Eigen::Matrix4d lookAt(const Eigen::Vector3d &eye, const Eigen::Vector3d &target, const Eigen::Vector3d &up);

/**
 * @brief selectStrategy cube corners for 8 views, strategic table for 12, uniform fan otherwise
 * @throws std::invalid_argument for n<1
 */
ViewTableStrategy selectStrategy(const int n);

std::string strategyName(const ViewTableStrategy &strategy);

ViewList generate(const ViewTableStrategy &strategy);

ViewList generate(const int n);

/**
 * @brief displayLabel label text for annotation, single word table labels get a " View" suffix
 */
std::string displayLabel(const std::string &label);

/**
 * @brief isProperRotation orthonormal 3x3 block with determinant +1, no translation
 */
bool isProperRotation(const Eigen::Matrix4d &T, const double tolerance = 1e-9);

// camera looks along -Z
const Eigen::Vector3d camera_forward(0, 0, -1);
const Eigen::Vector3d vertical_axis(0, 1, 0);
const Eigen::Vector3d horizontal_axis(1, 0, 0);

}

#endif // VIEWTABLE_HPP
