#include <gtest/gtest.h>

#include <Annotation.hpp>

#include <opencv2/imgcodecs.hpp>

#include "TestAssets.hpp"

class AnnotationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = TestAssets::makeTempDir("annotation");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    RenderedView writeView(const int index, const std::string &label, const int size = 256) {
        RenderedView view;
        view.index = index;
        view.label = label;
        view.path = dir / ("view_00"+std::to_string(index)+".png");
        const cv::Mat img(size, size, CV_8UC3, cv::Scalar::all(255));
        EXPECT_TRUE(cv::imwrite(view.path.string(), img));
        return view;
    }

    fs::path dir;
};

TEST_F(AnnotationTest, AnnotatedPath) {
    EXPECT_EQ(Annotation::annotatedPath("out", 3), fs::path("out/annotated/view_003_annotated.png"));
    EXPECT_EQ(Annotation::annotatedPath("out", 12, "_b"), fs::path("out/annotated/view_012_annotated_b.png"));
}

TEST_F(AnnotationTest, MissingFontsFallBack) {
    Annotation::LabelFont font = Annotation::LabelFont::resolve({"/nonexistent/font.ttf", (dir / "empty.ttf").string()});
    EXPECT_TRUE(font.isFallback());

    int baseline = 0;
    const cv::Size size = font.textSize("Top View", &baseline);
    EXPECT_GT(size.width, 0);
    EXPECT_GT(size.height, 0);
}

TEST_F(AnnotationTest, LabelChangesTopRegionOnly) {
    const RenderedView view = writeView(0, "Top");
    const fs::path dst = dir / "labelled.png";

    const Annotation::LabelFont font = Annotation::LabelFont::resolve(Annotation::defaultFontPaths());
    Annotation::annotateImage(view.path, "Top View", dst, font);

    ASSERT_TRUE(fs::exists(dst));
    const cv::Mat src = cv::imread(view.path.string());
    const cv::Mat out = cv::imread(dst.string());
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.size(), src.size());

    // label box at the top centre, bottom half untouched
    const cv::Rect label_region(src.cols/4, 0, src.cols/2, 40);
    EXPECT_GT(cv::norm(src(label_region), out(label_region), cv::NORM_L1), 0.0);
    const cv::Rect bottom(0, src.rows/2, src.cols, src.rows/2);
    EXPECT_EQ(cv::norm(src(bottom), out(bottom), cv::NORM_L1), 0.0);

    // source is preserved
    const cv::Mat reread = cv::imread(view.path.string());
    EXPECT_EQ(cv::countNonZero(reread.reshape(1)!=255), 0);
}

TEST_F(AnnotationTest, AnnotateViews) {
    std::vector<RenderedView> views;
    views.push_back(writeView(0, "Front"));
    views.push_back(writeView(1, "Front-Top-Right"));

    RenderedView missing;
    missing.index = 2;
    missing.label = "Back";
    missing.path = dir / "view_002.png";
    views.push_back(missing);

    const std::vector<AnnotatedView> annotated = Annotation::annotateViews(views, dir);
    ASSERT_EQ(annotated.size(), 2u);

    EXPECT_EQ(annotated[0].label, "Front View");
    EXPECT_EQ(annotated[1].label, "Front-Top-Right");
    for(const AnnotatedView &a : annotated) {
        EXPECT_TRUE(fs::exists(a.path)) << a.path;
        EXPECT_TRUE(fs::exists(a.source.path));
        EXPECT_EQ(a.path.parent_path(), dir / "annotated");
    }
    EXPECT_FALSE(fs::exists(Annotation::annotatedPath(dir, 2)));
}

TEST_F(AnnotationTest, LabelWiderThanImage) {
    cv::Mat img(40, 60, CV_8UC3, cv::Scalar::all(255));
    const Annotation::LabelFont font = Annotation::LabelFont::resolve({});
    EXPECT_NO_THROW(Annotation::annotateLabel(img, "Front-Bottom-Right", font));
    EXPECT_EQ(img.size(), cv::Size(60, 40));
}
