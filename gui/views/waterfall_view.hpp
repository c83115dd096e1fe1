// Waterfall surface renderer for ImGui
#pragma once

#include <imgui.h>
#include "axis_ticks.hpp"
#include "scroll_buffer.hpp"

namespace gui {

class WaterfallView {
public:
    // Axis strips overlaid on the image
    static constexpr float frequency_strip_px = 22.0f;
    static constexpr float time_strip_px = 48.0f;

    bool show_axes = true;

    WaterfallView() = default;
    ~WaterfallView();
    WaterfallView(const WaterfallView&) = delete;
    WaterfallView& operator=(const WaterfallView&) = delete;

    // Marks the GPU copy stale; the next draw re-uploads the whole buffer
    void invalidate() { dirty_ = true; }

    // Draws the buffer stretched over width x height, then the axes
    void draw(ImDrawList* dl,
              const ImVec2& canvas_pos,
              float width,
              float height,
              const waterfall::ScrollBuffer& buffer,
              waterfall::FrequencyScaleMode mode,
              const waterfall::AxisContext& ctx);

    // Releases the GL texture (needs a current context)
    void release();

    int uploads() const { return uploads_; }

private:
    void upload(const waterfall::ScrollBuffer& buffer);
    void draw_axes(ImDrawList* dl, const ImVec2& p0, const ImVec2& p1,
                   const waterfall::AxisLayout& layout);

    unsigned int texture_id_ = 0; // GL texture id (GLuint)
    int tex_w_ = 0;
    int tex_h_ = 0;
    bool dirty_ = true;
    int uploads_ = 0;
};

} // namespace gui
