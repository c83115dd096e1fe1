#include "waterfall_view.hpp"

#include <algorithm>
#include <cstdint>
#include <GLES3/gl3.h>

namespace gui {

WaterfallView::~WaterfallView() {
    release();
}

void WaterfallView::release() {
    if (texture_id_ != 0) {
        GLuint id = texture_id_;
        glDeleteTextures(1, &id);
        texture_id_ = 0;
    }
    tex_w_ = tex_h_ = 0;
    dirty_ = true;
}

void WaterfallView::upload(const waterfall::ScrollBuffer& buffer) {
    const int w = buffer.width();
    const int h = buffer.height();
    if (texture_id_ == 0 || tex_w_ != w || tex_h_ != h) {
        if (texture_id_ != 0) {
            GLuint id = texture_id_;
            glDeleteTextures(1, &id);
            texture_id_ = 0;
        }
        GLuint id = 0;
        glGenTextures(1, &id);
        texture_id_ = id;
        tex_w_ = w;
        tex_h_ = h;
        glBindTexture(GL_TEXTURE_2D, texture_id_);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, tex_w_, tex_h_, 0, GL_RGBA, GL_UNSIGNED_BYTE, buffer.rgba());
    } else {
        glBindTexture(GL_TEXTURE_2D, texture_id_);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        // Whole surface per produced row; the buffer has already scrolled
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, tex_w_, tex_h_, GL_RGBA, GL_UNSIGNED_BYTE, buffer.rgba());
    }
    ++uploads_;
    dirty_ = false;
}

void WaterfallView::draw(ImDrawList* dl,
                         const ImVec2& canvas_pos,
                         float width,
                         float height,
                         const waterfall::ScrollBuffer& buffer,
                         waterfall::FrequencyScaleMode mode,
                         const waterfall::AxisContext& ctx) {
    if (!dl || width <= 0 || height <= 0) return;

    const ImVec2 p0 = canvas_pos;
    const ImVec2 p1 = ImVec2(canvas_pos.x + width, canvas_pos.y + height);

    dl->AddRectFilled(p0, p1, IM_COL32(0, 0, 0, 255));
    ImGui::PushClipRect(p0, p1, true);

    if (buffer.width() > 0 && buffer.height() > 0) {
        if (dirty_ || tex_w_ != buffer.width() || tex_h_ != buffer.height()) upload(buffer);
        ImTextureID tid = (ImTextureID)(intptr_t)texture_id_;
        dl->AddImage(tid, p0, p1, ImVec2(0, 0), ImVec2(1, 1));
    }

    if (show_axes) {
        // The host sizes the buffer to the canvas, so tick pixels are canvas pixels
        const auto layout = waterfall::layout_axes(mode, ctx, buffer.width(), buffer.height());
        draw_axes(dl, p0, p1, layout);
    }

    ImGui::PopClipRect();
    dl->AddRect(p0, p1, IM_COL32(60, 60, 60, 255));
}

void WaterfallView::draw_axes(ImDrawList* dl, const ImVec2& p0, const ImVec2& p1,
                              const waterfall::AxisLayout& layout) {
    const ImU32 strip_bg = IM_COL32(0, 0, 0, 140);
    const ImU32 tick_col = IM_COL32(220, 220, 220, 220);
    const ImU32 text_col = IM_COL32(235, 235, 235, 255);
    const ImU32 grid_col = IM_COL32(255, 255, 255, 28);

    const float fy0 = p1.y - frequency_strip_px;
    const float tx0 = p1.x - time_strip_px;

    dl->AddRectFilled(ImVec2(p0.x, fy0), p1, strip_bg);
    dl->AddRectFilled(ImVec2(tx0, p0.y), ImVec2(p1.x, fy0), strip_bg);

    // Frequency: bottom strip, tick marks pointing up, label centred on the tick
    for (const auto& tick : layout.frequency) {
        const float x = p0.x + tick.position;
        if (x < p0.x || x > tx0) continue;
        dl->AddLine(ImVec2(x, p0.y), ImVec2(x, fy0), grid_col, 1.0f);
        dl->AddLine(ImVec2(x, fy0), ImVec2(x, fy0 + 5.0f), tick_col, 1.0f);
        const ImVec2 ts = ImGui::CalcTextSize(tick.label.c_str());
        const float lx = std::max(p0.x + 2.0f, std::min(x - ts.x * 0.5f, tx0 - ts.x - 2.0f));
        dl->AddText(ImVec2(lx, fy0 + 6.0f), text_col, tick.label.c_str());
    }

    // Time: right strip, newest row at the top
    for (const auto& tick : layout.time) {
        const float y = p0.y + tick.position;
        if (y < p0.y || y > fy0) continue;
        dl->AddLine(ImVec2(p0.x, y), ImVec2(tx0, y), grid_col, 1.0f);
        dl->AddLine(ImVec2(tx0, y), ImVec2(tx0 + 5.0f, y), tick_col, 1.0f);
        const ImVec2 ts = ImGui::CalcTextSize(tick.label.c_str());
        const float ly = std::max(p0.y + 1.0f, std::min(y - ts.y * 0.5f, fy0 - ts.y - 1.0f));
        dl->AddText(ImVec2(tx0 + 7.0f, ly), text_col, tick.label.c_str());
    }
}

} // namespace gui
