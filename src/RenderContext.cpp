#include "RenderContext.hpp"
#include "Errors.hpp"

#include <pangolin/display/display.h>

#include <opencv2/imgproc.hpp>

#include <iostream>

RenderContext::RenderContext(const int width, const int height)
    : window_name("MultiViewRender"), w(width), h(height), window_created(false)
{
    if(w<=0 || h<=0)
        throw std::invalid_argument("invalid render size "+std::to_string(w)+"x"+std::to_string(h));

    try {
        // no visible window, render into an EGL surface
        pangolin::CreateWindowAndBind(window_name, w, h, pangolin::Params({{"scheme", "headless"}}));
        window_created = true;

        glEnable(GL_DEPTH_TEST);

        // off-screen buffer
        color_buffer.reset(new pangolin::GlTexture(w, h, GL_RGBA8));
        depth_buffer.reset(new pangolin::GlRenderBuffer(w, h, GL_DEPTH_COMPONENT24));
        fbo_buffer.reset(new pangolin::GlFramebuffer(*color_buffer, *depth_buffer));

        fbo_buffer->Bind();
        const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
        fbo_buffer->Unbind();
        if(status!=GL_FRAMEBUFFER_COMPLETE)
            throw RenderFailure("incomplete frame buffer, status "+std::to_string(status));

        checkError("context setup");
    }
    catch(const RenderFailure &) {
        release();
        throw;
    }
    catch(const std::exception &e) {
        release();
        throw RenderFailure(std::string("cannot create off-screen context: ")+e.what());
    }

    std::cout<<"off-screen context "<<w<<"x"<<h<<std::endl;
}

RenderContext::~RenderContext() {
    release();
}

void RenderContext::release() {
    // frame buffer objects need the context, delete them first
    fbo_buffer.reset();
    depth_buffer.reset();
    color_buffer.reset();

    if(window_created) {
        pangolin::DestroyWindow(window_name);
        window_created = false;
    }
}

void RenderContext::beginFrame(const Eigen::Vector4d &background) {
    glViewport(0, 0, w, h);

    fbo_buffer->Bind();
    glClearColor(background[0], background[1], background[2], background[3]);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

cv::Mat RenderContext::readColour() {
    glFlush();

    cv::Mat buffer(h, w, CV_8UC3);
    glReadBuffer(GL_COLOR_ATTACHMENT0);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(0, 0, w, h, GL_RGB, GL_UNSIGNED_BYTE, buffer.data);

    // deactivate frame buffer
    fbo_buffer->Unbind();

    // flip around x-axis, origin from bottom left to top left
    cv::flip(buffer, buffer, 0);
    cv::cvtColor(buffer, buffer, cv::COLOR_RGB2BGR);
    return buffer;
}

void RenderContext::checkError(const std::string &what, const int view_index) const {
    const GLenum err = glGetError();
    if(err!=GL_NO_ERROR)
        throw RenderFailure(what+": OpenGL error 0x"+cv::format("%04x", err), view_index);
}
