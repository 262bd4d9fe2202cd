#include <cstdio>
#include <memory>
#include <optional>
#include <vecanim/vecanim.hpp>

using namespace vecanim;

// Prints every draw call instead of rasterizing.
class ConsoleRenderer : public Renderer
{
   public:
    void initialize(float width, float height) override
    {
        width_  = width;
        height_ = height;
        VECANIM_LOG_INFO("example", "Renderer initialized {}x{}", width, height);
    }
    void resize(float width, float height) override
    {
        width_  = width;
        height_ = height;
    }
    float width() const override { return width_; }
    float height() const override { return height_; }

    void begin_frame() override { draws_ = 0; }
    void end_frame() override { std::printf("  frame: %d draw calls\n", draws_); }
    void clear(const Color&) override {}

    void save() override {}
    void restore() override {}
    void transform(const Mat2D& m) override
    {
        tx_ = m.tx;
        ty_ = m.ty;
    }
    void set_opacity(float opacity) override { opacity_ = opacity; }

    void draw_path(const Path&, const Paint& paint) override
    {
        ++draws_;
        std::printf("  fill   %-8s at (%6.1f, %6.1f) opacity %.2f\n",
                    paint.is_gradient() ? "gradient" : "solid",
                    tx_,
                    ty_,
                    opacity_);
    }
    void draw_stroke(const Path&, const Paint&, float width) override
    {
        ++draws_;
        std::printf("  stroke width %.1f\n", width);
    }
    void draw_image(const ImageAsset& image, const std::optional<Rect>& source, const Mat2D&) override
    {
        ++draws_;
        if (source)
            std::printf("  image  %s [%.0fx%.0f]\n", image.id.c_str(), source->w, source->h);
        else
            std::printf("  image  %s\n", image.id.c_str());
    }

   private:
    float width_   = 0.0f;
    float height_  = 0.0f;
    float tx_      = 0.0f;
    float ty_      = 0.0f;
    float opacity_ = 1.0f;
    int   draws_   = 0;
};

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    RuntimeConfig config = RuntimeConfig::from_env();
    config.loop_mode     = LoopMode::PingPong;

    AnimationRuntime runtime(config, std::make_unique<ManualClock>());
    ConsoleRenderer  renderer;
    runtime.set_renderer(&renderer);

    AnimationData data;
    data.scene    = std::make_unique<SceneGraph>();
    data.artboard = data.scene->create_artboard(320.0f, 240.0f, colors::black, "stage");

    NodeId ball = data.scene->create_shape(Path::ellipse({0.0f, 0.0f}, 16.0f, 16.0f), "ball");
    data.scene->set_fill(ball, Paint::solid(colors::red));
    data.scene->set_stroke(ball, Paint::solid(colors::white));
    data.scene->set_stroke_width(ball, 2.0f);
    data.scene->add_child(data.artboard, ball);

    data.timeline = std::make_unique<Timeline>(1.0f, 30.0f);
    data.timeline->add_track(*data.scene, ball, "transform.position.x")
        .add_keyframe(0.0f, 20.0f, Interpolation::Linear, ease::in_out_quad)
        .add_keyframe(1.0f, 300.0f);
    data.timeline->add_track(*data.scene, ball, "transform.position.y")
        .add_keyframe(0.0f, 120.0f, Interpolation::Linear, ease::bounce)
        .add_keyframe(1.0f, 200.0f);
    data.timeline->add_track(*data.scene, ball, "opacity")
        .add_keyframe(0.0f, 1.0f)
        .add_keyframe(0.5f, 0.4f)
        .add_keyframe(1.0f, 1.0f);

    runtime.load(std::move(data));
    runtime.on(RuntimeEvent::Loop,
               [&runtime](RuntimeEvent, PlaybackState)
               {
                   VECANIM_LOG_INFO("example",
                                    "Bounced at {}s, direction {}",
                                    runtime.current_time(),
                                    runtime.direction());
               });

    runtime.play();

    // Stand-in for a display loop: 45 frames at 30 fps.
    auto&       clock = static_cast<ManualClock&>(runtime.clock());
    const float dt    = 1.0f / 30.0f;
    for (int frame = 0; frame < 45; ++frame)
    {
        clock.advance(dt);
        runtime.scheduler().dispatch(dt);
        if (frame % 15 == 0)
            std::printf("t=%.3fs redraw_all=%s regions=%zu\n",
                        runtime.current_time(),
                        runtime.should_redraw_all() ? "yes" : "no",
                        runtime.dirty_regions().region_count());
    }

    runtime.stop();
    VECANIM_LOG_INFO("example",
                     "Done: {} frames, avg {}ms",
                     runtime.scheduler().frame_number(),
                     runtime.scheduler().average_frame_time_ms());
    return 0;
}
