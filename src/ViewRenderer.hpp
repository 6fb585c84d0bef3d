#ifndef VIEWRENDERER_HPP
#define VIEWRENDERER_HPP

#include <string>
#include <vector>
#include <filesystem>

#include "Mesh.hpp"
#include "ViewTable.hpp"
#include "SceneConfig.hpp"

namespace fs = std::filesystem;

/**
 * @brief RenderedView, a view written to disk, the pixels are not kept
 */
struct RenderedView {
    int index;
    std::string label;
    fs::path path;
};

namespace ViewRenderer {

/**
 * @brief viewFileName "view_<index>.png" with three digit zero padded index
 */
std::string viewFileName(const int index);

/**
 * @brief renderViews render one image per view of an already normalised mesh
 * The output directory is created if missing. Files of views rendered before
 * a failure remain on disk.
 * @throws RenderFailure on output directory, context, rasterisation or write errors
 */
std::vector<RenderedView> renderViews(const Mesh &mesh, const ViewList &views,
                                      const fs::path &out_dir, const SceneConfig &config);

/**
 * @brief renderViews load and normalise the asset and render the view table selected by 'n_views'
 * 'n_views' of 0 selects the default number of views of the configured mode.
 * @throws UnsupportedAssetError, DegenerateMeshError before anything is written
 */
std::vector<RenderedView> renderViews(const std::string &mesh_path, const fs::path &out_dir,
                                      const int n_views, const SceneConfig &config);

}

#endif // VIEWRENDERER_HPP
