#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief UnsupportedAssetError, the mesh container could not be read or holds no triangle geometry
 */
class UnsupportedAssetError : public std::runtime_error {
public:
    explicit UnsupportedAssetError(const std::string &what) : std::runtime_error(what) { }
};

/**
 * @brief DegenerateMeshError, the mesh has zero extent on all axes and cannot be rescaled
 */
class DegenerateMeshError : public std::runtime_error {
public:
    explicit DegenerateMeshError(const std::string &what) : std::runtime_error(what) { }
};

/**
 * @brief RenderFailure, offscreen context or rasterisation failed
 * The view index is -1 if the failure happened outside of the per-view loop.
 */
class RenderFailure : public std::runtime_error {
public:
    RenderFailure(const std::string &what, const int view_index = -1)
        : std::runtime_error(view_index<0 ? what : "view "+std::to_string(view_index)+": "+what),
          view_index(view_index) { }

    int viewIndex() const { return view_index; }

private:
    int view_index;
};

#endif // ERRORS_HPP
