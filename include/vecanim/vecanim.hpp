#pragma once

#include <vecanim/clock.hpp>
#include <vecanim/color.hpp>
#include <vecanim/config.hpp>
#include <vecanim/dirty_regions.hpp>
#include <vecanim/easing.hpp>
#include <vecanim/error.hpp>
#include <vecanim/frame_scheduler.hpp>
#include <vecanim/fwd.hpp>
#include <vecanim/interpolator.hpp>
#include <vecanim/logger.hpp>
#include <vecanim/math2d.hpp>
#include <vecanim/object_pool.hpp>
#include <vecanim/paint.hpp>
#include <vecanim/path.hpp>
#include <vecanim/plugin.hpp>
#include <vecanim/property.hpp>
#include <vecanim/renderer.hpp>
#include <vecanim/runtime.hpp>
#include <vecanim/scene.hpp>
#include <vecanim/state_machine.hpp>
#include <vecanim/timeline.hpp>

// ─── Typical use ─────────────────────────────────────────────────────────────
//
//   vecanim::AnimationData data;
//   data.scene    = std::make_unique<vecanim::SceneGraph>();
//   data.artboard = data.scene->create_artboard(400, 300);
//   auto box      = data.scene->create_shape(vecanim::Path::rectangle(0, 0, 50, 50));
//   data.scene->add_child(data.artboard, box);
//
//   data.timeline = std::make_unique<vecanim::Timeline>(2.0f);
//   data.timeline->add_track(*data.scene, box, "transform.position.x")
//       .add_keyframe(0.0f, 0.0f)
//       .add_keyframe(2.0f, 350.0f);
//
//   vecanim::AnimationRuntime runtime;
//   runtime.load(std::move(data));
//   runtime.play();
//   // per display frame:
//   runtime.scheduler().run_frame();
