#ifndef RENDERCONTEXT_HPP
#define RENDERCONTEXT_HPP

#include <string>
#include <memory>

#include <pangolin/gl/gl.h>

#include <opencv2/core.hpp>

#include <Eigen/Core>

/**
 * @brief RenderContext, headless OpenGL context with an off-screen frame buffer
 * The context is created in the constructor and released in the destructor,
 * also when rendering fails with an exception. Only one instance may exist at a time.
 */
class RenderContext {
public:
    /**
     * @throws RenderFailure if no context or frame buffer can be created
     */
    RenderContext(const int width, const int height);

    ~RenderContext();

    RenderContext(const RenderContext &) = delete;
    RenderContext& operator=(const RenderContext &) = delete;

    /**
     * @brief beginFrame bind the frame buffer and clear colour and depth
     */
    void beginFrame(const Eigen::Vector4d &background);

    /**
     * @brief readColour read back the frame buffer and unbind it
     * @return 8 bit BGR image with origin at the top left
     */
    cv::Mat readColour();

    /**
     * @brief checkError throw RenderFailure if OpenGL reported an error
     */
    void checkError(const std::string &what, const int view_index = -1) const;

private:
    void release();

    const std::string window_name;
    const int w;
    const int h;
    bool window_created;

    std::unique_ptr<pangolin::GlTexture> color_buffer;
    std::unique_ptr<pangolin::GlRenderBuffer> depth_buffer;
    std::unique_ptr<pangolin::GlFramebuffer> fbo_buffer;
};

#endif // RENDERCONTEXT_HPP
