#include "Annotation.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Annotation {

namespace {

const cv::Scalar text_colour(255, 255, 255);
const int text_top = 10;    // pixels from top of frame
const int padding = 10;
const double box_alpha = 180.0/255.0;

}

LabelFont::LabelFont(const int height)
    : height(height), thickness(2),
      hershey_scale(cv::getFontScaleFromHeight(cv::FONT_HERSHEY_SIMPLEX, height, 2)) { }

LabelFont LabelFont::resolve(const std::vector<std::string> &candidates, const int height) {
    LabelFont font(height);

#ifdef HAVE_OPENCV_FREETYPE
    for(const std::string &path : candidates) {
        std::error_code ec;
        if(!fs::is_regular_file(path, ec))
            continue;
        try {
            cv::Ptr<cv::freetype::FreeType2> ft2 = cv::freetype::createFreeType2();
            ft2->loadFontData(path, 0);
            font.ft2 = ft2;
            font.font_path = path;
            font.thickness = -1;    // filled glyphs
            std::cout<<"label font: "<<path<<std::endl;
            return font;
        }
        catch(const cv::Exception &e) {
            std::cerr<<"cannot load font "<<path<<": "<<e.what()<<std::endl;
        }
    }
#else
    (void)candidates;
#endif

    std::cerr<<"using built-in font for labels"<<std::endl;
    return font;
}

cv::Size LabelFont::textSize(const std::string &text, int *baseline) const {
#ifdef HAVE_OPENCV_FREETYPE
    if(!isFallback())
        return ft2->getTextSize(text, height, thickness, baseline);
#endif
    return cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, hershey_scale, thickness, baseline);
}

void LabelFont::draw(cv::Mat &img, const std::string &text, const cv::Point &origin, const cv::Scalar &colour) const {
#ifdef HAVE_OPENCV_FREETYPE
    if(!isFallback()) {
        ft2->putText(img, text, origin, height, colour, thickness, cv::LINE_AA, true);
        return;
    }
#endif
    cv::putText(img, text, origin, cv::FONT_HERSHEY_SIMPLEX, hershey_scale, colour, thickness, cv::LINE_AA);
}

const std::vector<std::string>& defaultFontPaths() {
    static const std::vector<std::string> paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/System/Library/Fonts/Helvetica.ttc",
    };
    return paths;
}

fs::path annotatedPath(const fs::path &out_dir, const int index, const std::string &suffix) {
    std::ostringstream name;
    name<<"view_"<<std::setw(3)<<std::setfill('0')<<index<<"_annotated"<<suffix<<".png";
    return out_dir / "annotated" / name.str();
}

void annotateLabel(cv::Mat &img, const std::string &label, const LabelFont &font) {
    int baseline = 0;
    const cv::Size text = font.textSize(label, &baseline);

    // top centre
    const int x = (img.cols-text.width)/2;
    const int y = text_top;

    // darkened background box with padding, clipped to the image
    const cv::Rect box = cv::Rect(x-padding, y-padding, text.width+2*padding, text.height+baseline+2*padding)
            & cv::Rect(0, 0, img.cols, img.rows);
    if(box.area()>0) {
        cv::Mat roi = img(box);
        const cv::Mat black(roi.size(), roi.type(), cv::Scalar::all(0));
        cv::addWeighted(black, box_alpha, roi, 1.0-box_alpha, 0.0, roi);
    }

    font.draw(img, label, cv::Point(x, y+text.height), text_colour);
}

void annotateImage(const fs::path &src, const std::string &label, const fs::path &dst, const LabelFont &font) {
    cv::Mat img = cv::imread(src.string(), cv::IMREAD_COLOR);
    if(img.empty())
        throw std::runtime_error("cannot read image "+src.string());

    annotateLabel(img, label, font);

    if(!cv::imwrite(dst.string(), img))
        throw std::runtime_error("cannot write image "+dst.string());
}

std::vector<AnnotatedView> annotateViews(const std::vector<RenderedView> &views, const fs::path &out_dir,
                                         const std::string &suffix)
{
    fs::create_directories(out_dir / "annotated");

    const LabelFont font = LabelFont::resolve(defaultFontPaths());

    std::vector<AnnotatedView> annotated;
    for(const RenderedView &view : views) {
        if(!fs::exists(view.path)) {
            std::cerr<<"skipping missing view "<<view.path.string()<<std::endl;
            continue;
        }

        AnnotatedView out;
        out.source = view;
        out.label = ViewTable::displayLabel(view.label);
        out.path = annotatedPath(out_dir, view.index, suffix);

        annotateImage(view.path, out.label, out.path, font);
        annotated.push_back(out);
    }

    std::cout<<"Generated "<<annotated.size()<<" annotated images."<<std::endl;

    return annotated;
}

} // namespace Annotation
