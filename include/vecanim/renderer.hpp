#pragma once

#include <optional>
#include <vecanim/color.hpp>
#include <vecanim/math2d.hpp>
#include <vecanim/paint.hpp>
#include <vecanim/path.hpp>
#include <vecanim/scene.hpp>

namespace vecanim
{

// Immediate-mode drawing backend driven by the runtime's render pass. The
// runtime never rasterizes; implementations map these calls onto a real
// graphics API. save()/restore() bracket transform and opacity state.
class Renderer
{
   public:
    virtual ~Renderer() = default;

    // Lifecycle
    virtual void  initialize(float width, float height) = 0;
    virtual void  resize(float width, float height)     = 0;
    virtual float width() const                         = 0;
    virtual float height() const                        = 0;

    // Frame
    virtual void begin_frame()              = 0;
    virtual void end_frame()                = 0;
    virtual void clear(const Color& color)  = 0;

    // State stack
    virtual void save()                          = 0;
    virtual void restore()                       = 0;
    virtual void transform(const Mat2D& matrix)  = 0;
    virtual void set_opacity(float opacity)      = 0;

    // Drawing
    virtual void draw_path(const Path& path, const Paint& paint)                    = 0;
    virtual void draw_stroke(const Path& path, const Paint& paint, float width)     = 0;
    // `source_rect` is the region of the image drawn at the node origin; the
    // whole image when empty.
    virtual void draw_image(const ImageAsset&          image,
                            const std::optional<Rect>& source_rect,
                            const Mat2D&               matrix) = 0;
};

}  // namespace vecanim
