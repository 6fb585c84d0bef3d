#include "ViewTable.hpp"

#include <cmath>
#include <stdexcept>

namespace ViewTable {

namespace {

// below this norm of the cross product, vectors are treated as parallel
const double parallel_epsilon = 1e-8;

ViewSpec makeView(const int index, const std::string &label, const Eigen::Matrix4d &rotation) {
    ViewSpec view;
    view.index = index;
    view.label = label;
    view.rotation = rotation;
    return view;
}

std::string signLabel(const double v, const char axis) {
    return std::string(v<0 ? "-" : "+") + axis;
}

struct ViewTableGenerator {
    ViewList operator()(const CubeCorners &) const {
        // all sign combinations of (x,y,z), x varies slowest
        ViewList views;
        for(int i(0); i<8; i++) {
            const Eigen::Vector3d corner(i&4 ? 1 : -1, i&2 ? 1 : -1, i&1 ? 1 : -1);
            const std::string label = "Corner " + signLabel(corner.x(), 'X') +
                    signLabel(corner.y(), 'Y') + signLabel(corner.z(), 'Z');
            views.push_back(makeView(i, label, rotationFromVectors(corner, camera_forward)));
        }
        return views;
    }

    ViewList operator()(const Strategic12 &) const {
        ViewList views;

        // cardinal directions about the vertical axis
        const char* cardinal[4] = {"Front", "Right", "Back", "Left"};
        for(int i(0); i<4; i++) {
            views.push_back(makeView(i, cardinal[i], rotationMatrix(M_PI/2*i, vertical_axis)));
        }

        views.push_back(makeView(4, "Top", rotationMatrix(-M_PI/2, horizontal_axis)));
        views.push_back(makeView(5, "Bottom", rotationMatrix(M_PI/2, horizontal_axis)));

        // oblique corner views, horizontal angle and vertical tilt
        struct Corner { double h; double v; const char* label; };
        const Corner corners[6] = {
            {  M_PI/4,  M_PI/6, "Front-Top-Right"},
            {3*M_PI/4,  M_PI/6, "Back-Top-Right"},
            {5*M_PI/4,  M_PI/6, "Back-Top-Left"},
            {7*M_PI/4,  M_PI/6, "Front-Top-Left"},
            {  M_PI/4, -M_PI/6, "Front-Bottom-Right"},
            {5*M_PI/4, -M_PI/6, "Back-Bottom-Left"},
        };
        for(int i(0); i<6; i++) {
            const Eigen::Matrix4d rot_h = rotationMatrix(corners[i].h, vertical_axis);
            const Eigen::Matrix4d rot_v = rotationMatrix(corners[i].v, horizontal_axis);
            views.push_back(makeView(6+i, corners[i].label, rot_h*rot_v));
        }

        return views;
    }

    ViewList operator()(const UniformFan &fan) const {
        ViewList views;
        for(int i(0); i<fan.n; i++) {
            const double theta = 2*M_PI*(double(i)/fan.n);
            views.push_back(makeView(i, "View "+std::to_string(i+1), rotationMatrix(theta, vertical_axis)));
        }
        return views;
    }
};

struct StrategyNamer {
    std::string operator()(const CubeCorners &) const { return "cube corners"; }
    std::string operator()(const Strategic12 &) const { return "strategic 12"; }
    std::string operator()(const UniformFan &fan) const { return "uniform fan ("+std::to_string(fan.n)+")"; }
};

} // namespace

Eigen::Matrix4d rotationMatrix(const double angle, const Eigen::Vector3d &axis) {
    Eigen::Matrix4d T = Eigen::Matrix4d::Identity();
    T.topLeftCorner<3,3>() = Eigen::AngleAxisd(angle, axis.normalized()).toRotationMatrix();
    return T;
}

Eigen::Matrix4d rotationFromVectors(const Eigen::Vector3d &a, const Eigen::Vector3d &b) {
    if(a.norm()==0 || b.norm()==0)
        throw std::invalid_argument("rotation between zero-length vectors");

    const Eigen::Vector3d from = a.normalized();
    const Eigen::Vector3d to = b.normalized();

    const Eigen::Vector3d v = from.cross(to);
    const double c = from.dot(to);
    const double s = v.norm();

    if(s<parallel_epsilon) {
        // aligned
        if(c>0)
            return Eigen::Matrix4d::Identity();

        // antiparallel: half turn about any axis orthogonal to 'from'
        Eigen::Vector3d axis = Eigen::Vector3d::UnitX();
        if(std::abs(from.dot(axis))>0.9)
            axis = Eigen::Vector3d::UnitY();
        return rotationMatrix(M_PI, from.cross(axis).normalized());
    }

    return rotationMatrix(std::atan2(s, c), v/s);
}

Eigen::Matrix4d lookAt(const Eigen::Vector3d &eye, const Eigen::Vector3d &target, const Eigen::Vector3d &up) {
    const Eigen::Vector3d forward = (target-eye).normalized();
    const Eigen::Vector3d right = forward.cross(up).normalized();
    const Eigen::Vector3d true_up = right.cross(forward);

    Eigen::Matrix4d T = Eigen::Matrix4d::Identity();
    T.block<1,3>(0,0) = right.transpose();
    T.block<1,3>(1,0) = true_up.transpose();
    T.block<1,3>(2,0) = -forward.transpose();
    T.block<3,1>(0,3) = eye;
    return T;
}

ViewTableStrategy selectStrategy(const int n) {
    if(n<1)
        throw std::invalid_argument("number of views must be positive, got "+std::to_string(n));

    if(n==8)
        return CubeCorners();
    if(n==12)
        return Strategic12();
    return UniformFan{n};
}

std::string strategyName(const ViewTableStrategy &strategy) {
    return std::visit(StrategyNamer(), strategy);
}

ViewList generate(const ViewTableStrategy &strategy) {
    return std::visit(ViewTableGenerator(), strategy);
}

ViewList generate(const int n) {
    return generate(selectStrategy(n));
}

std::string displayLabel(const std::string &label) {
    if(label.find_first_of(" -")==std::string::npos)
        return label+" View";
    return label;
}

bool isProperRotation(const Eigen::Matrix4d &T, const double tolerance) {
    const Eigen::Matrix3d R = T.topLeftCorner<3,3>();
    const bool orthonormal = (R.transpose()*R-Eigen::Matrix3d::Identity()).cwiseAbs().maxCoeff()<tolerance;
    const bool proper = std::abs(R.determinant()-1)<tolerance;
    const bool rigid = T.block<3,1>(0,3).isZero(tolerance) &&
            (T.row(3)-Eigen::RowVector4d(0, 0, 0, 1)).cwiseAbs().maxCoeff()<tolerance;
    return orthonormal && proper && rigid;
}

} // namespace ViewTable
