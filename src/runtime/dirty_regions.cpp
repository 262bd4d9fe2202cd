#include <algorithm>
#include <vecanim/dirty_regions.hpp>

namespace vecanim
{

DirtyRegionManager::DirtyRegionManager(float merge_margin) : merge_margin_(std::max(0.0f, merge_margin))
{
}

void DirtyRegionManager::add_region(const Rect& region)
{
    regions_.push_back(region);
    dirty_ = true;
}

void DirtyRegionManager::add_regions(const std::vector<Rect>& regions)
{
    if (regions.empty())
        return;
    regions_.insert(regions_.end(), regions.begin(), regions.end());
    dirty_ = true;
}

void DirtyRegionManager::clear()
{
    regions_.clear();
    dirty_ = false;
}

void DirtyRegionManager::set_merge_margin(float margin)
{
    merge_margin_ = std::max(0.0f, margin);
}

void DirtyRegionManager::optimize()
{
    if (regions_.size() <= 1)
        return;

    std::stable_sort(regions_.begin(),
                     regions_.end(),
                     [](const Rect& a, const Rect& b) { return a.x < b.x; });

    scratch_.clear();
    Rect current = regions_.front();
    for (size_t i = 1; i < regions_.size(); ++i)
    {
        const Rect& next = regions_[i];
        if (current.expanded(merge_margin_).intersects(next))
        {
            current = current.united(next);
        }
        else
        {
            scratch_.push_back(current);
            current = next;
        }
    }
    scratch_.push_back(current);

    regions_.swap(scratch_);
}

std::optional<Rect> DirtyRegionManager::bounding_rect() const
{
    if (regions_.empty())
        return std::nullopt;

    Rect bounds = regions_.front();
    for (size_t i = 1; i < regions_.size(); ++i)
        bounds = bounds.united(regions_[i]);
    return bounds;
}

float DirtyRegionManager::total_area() const
{
    float area = 0.0f;
    for (const auto& r : regions_)
        area += r.area();
    return area;
}

bool DirtyRegionManager::should_redraw_all(float viewport_width,
                                           float viewport_height,
                                           float threshold) const
{
    float viewport_area = viewport_width * viewport_height;
    float dirty_area    = total_area();
    if (viewport_area <= 0.0f)
        return dirty_area > 0.0f;
    return dirty_area / viewport_area > threshold;
}

}  // namespace vecanim
