#include <pangolin/pangolin.h>

#include <ViewRenderer.hpp>
#include <Annotation.hpp>
#include <SceneConfig.hpp>

#include <iostream>

int main(int argc, char *argv[]) {
    if(argc<2) {
        std::cerr<<"usage: "<<argv[0]<<" <config file>"<<std::endl;
        std::cerr<<"keys: mesh_path, out_dir, render_mode (basic|enhanced), n_views, img_size, annotate, annotation_suffix"<<std::endl;
        return 1;
    }

    try {
        ////////////////////////////////////////////////////////////////////////////
        /// Configuration file
        pangolin::ParseVarsFile(argv[1]);

        const pangolin::Var<std::string> mesh_path("mesh_path", "");
        const fs::path out_dir = pangolin::Var<std::string>("out_dir", "renders").Get();
        const pangolin::Var<std::string> render_mode("render_mode", "enhanced");
        // 0: default of render mode
        const pangolin::Var<int> n_views("n_views", 0);
        const pangolin::Var<int> img_size("img_size", 0);
        const pangolin::Var<bool> annotate("annotate", true);
        const pangolin::Var<std::string> annotation_suffix("annotation_suffix", "");

        if(mesh_path.Get().empty()) {
            std::cerr<<"error: no 'mesh_path' in "<<argv[1]<<std::endl;
            return 1;
        }

        std::cout<<"mesh: "<<mesh_path.Get()<<std::endl;
        std::cout<<"save images to: "<<out_dir<<std::endl;

        const SceneConfig config = SceneConfig::forMode(parseRenderMode(render_mode.Get()), img_size.Get());

        ////////////////////////////////////////////////////////////////////////////
        /// Render
        const std::vector<RenderedView> views = ViewRenderer::renderViews(mesh_path.Get(), out_dir, n_views.Get(), config);

        if(annotate) {
            Annotation::annotateViews(views, out_dir, annotation_suffix.Get());
        }
    }
    catch(const std::exception &e) {
        std::cerr<<"error: "<<e.what()<<std::endl;
        return 1;
    }

    return 0;
}
