#include "ViewRenderer.hpp"
#include "MeshLoader.hpp"
#include "RenderContext.hpp"
#include "RenderScene.hpp"
#include "Errors.hpp"

#include <opencv2/imgcodecs.hpp>

#include <iostream>
#include <iomanip>
#include <sstream>

namespace ViewRenderer {

std::string viewFileName(const int index) {
    std::ostringstream name;
    name<<"view_"<<std::setw(3)<<std::setfill('0')<<index<<".png";
    return name.str();
}

std::vector<RenderedView> renderViews(const Mesh &mesh, const ViewList &views,
                                      const fs::path &out_dir, const SceneConfig &config)
{
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if(ec)
        throw RenderFailure("cannot create output directory "+out_dir.string()+": "+ec.message());

    // scene is declared after the context and released before it
    RenderContext context(config.img_size, config.img_size);
    RenderScene scene(mesh, config);
    context.checkError("scene setup");

    std::vector<RenderedView> rendered;

    for(const ViewSpec &view : views) {
        // the object rotates, the camera stays fixed
        scene.setMeshPose(view.rotation);

        context.beginFrame(config.background);
        scene.render();
        context.checkError("rasterisation", view.index);

        const cv::Mat colour = context.readColour();
        context.checkError("read back", view.index);

        RenderedView out;
        out.index = view.index;
        out.label = view.label;
        out.path = out_dir / viewFileName(view.index);

        bool written = false;
        try {
            written = cv::imwrite(out.path.string(), colour);
        }
        catch(const cv::Exception &e) {
            throw RenderFailure("cannot write "+out.path.string()+": "+e.what(), view.index);
        }
        if(!written)
            throw RenderFailure("cannot write "+out.path.string(), view.index);

        std::cout<<"Saved "<<out.path.string()<<" ("<<view.label<<")"<<std::endl;
        rendered.push_back(out);
    }

    scene.clear();

    std::cout<<"Done rendering "<<rendered.size()<<" views."<<std::endl;

    return rendered;
}

std::vector<RenderedView> renderViews(const std::string &mesh_path, const fs::path &out_dir,
                                      const int n_views, const SceneConfig &config)
{
    const int n = (n_views==0) ? config.default_views : n_views;

    // fails before any output is created
    const ViewTableStrategy strategy = ViewTable::selectStrategy(n);
    const MeshPtr mesh = MeshLoader::getNormalisedMesh(mesh_path);

    std::cout<<"rendering "<<n<<" views ("<<ViewTable::strategyName(strategy)<<", "
             <<renderModeName(config.mode)<<", "<<config.img_size<<"px) to "<<out_dir.string()<<std::endl;

    return renderViews(*mesh, ViewTable::generate(strategy), out_dir, config);
}

} // namespace ViewRenderer
