#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>
#include <vecanim/math2d.hpp>
#include <vecanim/scene.hpp>

namespace vecanim
{

struct PoolStats
{
    size_t   available      = 0;
    size_t   in_use         = 0;
    uint64_t total_created  = 0;
    uint64_t total_acquired = 0;
    uint64_t total_released = 0;
    float    hit_rate       = 0.0f;  // 1 - created / acquired; 0 before the first acquire
};

// Reuse cache for objects allocated on the per-frame path. The pool owns every
// object it hands out; acquire() returns a borrowed pointer that stays valid
// until it is released and evicted, or until clear().
//
// Both lists are reserved up front, so acquire() and release() allocate only
// when more than `initial_size` objects are out at once. release() scans the
// objects in use, which stays short on the per-frame path.
template <typename T>
class ObjectPool
{
   public:
    using Factory = std::function<std::unique_ptr<T>()>;
    using Reset   = std::function<void(T&)>;

    // Pre-populates `initial_size` objects; those do not count as created.
    ObjectPool(Factory factory, Reset reset, size_t initial_size = 10, size_t max_size = 1000)
        : factory_(std::move(factory)), reset_(std::move(reset)), max_size_(max_size)
    {
        available_.reserve(initial_size);
        in_use_.reserve(initial_size);
        for (size_t i = 0; i < initial_size; ++i)
            available_.push_back(factory_());
    }

    ObjectPool(const ObjectPool&)            = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;
    ObjectPool(ObjectPool&&)                 = default;
    ObjectPool& operator=(ObjectPool&&)      = default;

    T* acquire()
    {
        ++total_acquired_;

        std::unique_ptr<T> obj;
        if (!available_.empty())
        {
            obj = std::move(available_.back());
            available_.pop_back();
        }
        else
        {
            obj = factory_();
            ++total_created_;
        }

        T* ptr = obj.get();
        in_use_.push_back(std::move(obj));
        return ptr;
    }

    // Objects this pool did not hand out, or already released, are ignored.
    void release(T* obj)
    {
        auto it = std::find_if(in_use_.begin(),
                               in_use_.end(),
                               [obj](const std::unique_ptr<T>& p) { return p.get() == obj; });
        if (it == in_use_.end())
            return;

        std::unique_ptr<T> owned = std::move(*it);
        if (it != in_use_.end() - 1)
            *it = std::move(in_use_.back());
        in_use_.pop_back();
        ++total_released_;

        if (reset_)
            reset_(*owned);

        // Beyond max_size the object is dropped here.
        if (available_.size() < max_size_)
            available_.push_back(std::move(owned));
    }

    void release_all(const std::vector<T*>& objects)
    {
        for (T* obj : objects)
            release(obj);
    }

    // Destroys every pooled object, including ones still acquired.
    void clear()
    {
        available_.clear();
        in_use_.clear();
    }

    PoolStats stats() const
    {
        PoolStats s;
        s.available      = available_.size();
        s.in_use         = in_use_.size();
        s.total_created  = total_created_;
        s.total_acquired = total_acquired_;
        s.total_released = total_released_;
        s.hit_rate       = total_acquired_ > 0
                               ? 1.0f
                                     - static_cast<float>(total_created_)
                                           / static_cast<float>(total_acquired_)
                               : 0.0f;
        return s;
    }

    size_t size() const { return available_.size(); }
    size_t in_use_count() const { return in_use_.size(); }
    size_t max_size() const { return max_size_; }

   private:
    Factory                                    factory_;
    Reset                                      reset_;
    size_t                                     max_size_;
    std::vector<std::unique_ptr<T>>            available_;
    std::vector<std::unique_ptr<T>>            in_use_;
    uint64_t                                   total_created_  = 0;
    uint64_t                                   total_acquired_ = 0;
    uint64_t                                   total_released_ = 0;
};

// Pools owned by one runtime and handed explicitly to the per-frame path.
struct PoolSet
{
    explicit PoolSet(size_t initial_size = 10, size_t max_size = 1000)
        : region_buffers([] { return std::make_unique<std::vector<Rect>>(); },
                         [](std::vector<Rect>& v) { v.clear(); },
                         initial_size,
                         max_size),
          traversal_stacks([] { return std::make_unique<std::vector<NodeId>>(); },
                           [](std::vector<NodeId>& v) { v.clear(); },
                           initial_size,
                           max_size)
    {
    }

    ObjectPool<std::vector<Rect>>   region_buffers;
    ObjectPool<std::vector<NodeId>> traversal_stacks;
};

}  // namespace vecanim
