#ifndef ANNOTATION_HPP
#define ANNOTATION_HPP

#include <string>
#include <vector>
#include <filesystem>

#include <opencv2/core.hpp>
#include <opencv2/opencv_modules.hpp>
#ifdef HAVE_OPENCV_FREETYPE
#include <opencv2/freetype.hpp>
#endif

#include "ViewRenderer.hpp"

/**
 * @brief AnnotatedView, rendered view with its label composited, stored next to the original
 */
struct AnnotatedView {
    RenderedView source;
    std::string label;
    fs::path path;
};

namespace Annotation {

/**
 * @brief LabelFont, TrueType font if one of the candidate files loads, otherwise the
 * built-in Hershey font
 */
class LabelFont {
public:
    /**
     * @brief resolve try the candidate font files in order, never throws
     * @param height text height in pixels
     */
    static LabelFont resolve(const std::vector<std::string> &candidates, const int height = 36);

    cv::Size textSize(const std::string &text, int *baseline) const;

    /**
     * @brief draw text with 'origin' at the left end of the baseline
     */
    void draw(cv::Mat &img, const std::string &text, const cv::Point &origin, const cv::Scalar &colour) const;

    bool isFallback() const { return font_path.empty(); }

private:
    explicit LabelFont(const int height);

    int height;
    int thickness;
    double hershey_scale;
    std::string font_path;

#ifdef HAVE_OPENCV_FREETYPE
    cv::Ptr<cv::freetype::FreeType2> ft2;
#endif
};

/**
 * @brief defaultFontPaths system fonts tried before falling back
 */
const std::vector<std::string>& defaultFontPaths();

/**
 * @brief annotatedPath "<out_dir>/annotated/view_<index>_annotated<suffix>.png"
 */
fs::path annotatedPath(const fs::path &out_dir, const int index, const std::string &suffix = "");

/**
 * @brief annotateLabel composite 'label' centred at the top of the image on a darkened, padded box
 */
void annotateLabel(cv::Mat &img, const std::string &label, const LabelFont &font);

/**
 * @brief annotateImage load 'src', add 'label' and write the result to 'dst'
 * @throws std::runtime_error if 'src' cannot be read or 'dst' cannot be written
 */
void annotateImage(const fs::path &src, const std::string &label, const fs::path &dst, const LabelFont &font);

/**
 * @brief annotateViews write labelled copies of all rendered views to the 'annotated' sub directory
 * Views whose image is missing are skipped.
 */
std::vector<AnnotatedView> annotateViews(const std::vector<RenderedView> &views, const fs::path &out_dir,
                                         const std::string &suffix = "");

}

#endif // ANNOTATION_HPP
