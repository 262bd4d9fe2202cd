#pragma once

#include <optional>
#include <vector>
#include <vecanim/math2d.hpp>

namespace vecanim
{

// Accumulates world-space rectangles that changed during a frame and reduces
// them to a redraw plan.
class DirtyRegionManager
{
   public:
    explicit DirtyRegionManager(float merge_margin = 10.0f);

    void add_region(const Rect& region);
    void add_regions(const std::vector<Rect>& regions);
    void clear();

    bool                     is_dirty() const { return dirty_; }
    const std::vector<Rect>& regions() const { return regions_; }
    size_t                   region_count() const { return regions_.size(); }

    float merge_margin() const { return merge_margin_; }
    void  set_merge_margin(float margin);

    // Sorts by x and folds each region into the running one while the running
    // region, grown by the merge margin, intersects it.
    void optimize();

    std::optional<Rect> bounding_rect() const;

    // Sum of region areas; overlaps count twice.
    float total_area() const;

    // True when the dirty area covers more than `threshold` of the viewport.
    bool should_redraw_all(float viewport_width,
                           float viewport_height,
                           float threshold = 0.5f) const;

   private:
    std::vector<Rect> regions_;
    std::vector<Rect> scratch_;
    float             merge_margin_ = 10.0f;
    bool              dirty_        = false;
};

}  // namespace vecanim
