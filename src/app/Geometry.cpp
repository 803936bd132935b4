#include "app/Geometry.hpp"

#include <algorithm>

namespace wv::app
{

Placement compute_placement(WindowOptions const &options, int screen_width,
                            int screen_height)
{
    Placement placement;
    if (options.width != 0)
    {
        placement.width = static_cast<int>(options.width);
    }
    if (options.height != 0)
    {
        placement.height = static_cast<int>(options.height);
    }
    if (options.center)
    {
        placement.default_position = false;
        placement.x = std::max(0, (screen_width - placement.width) / 2);
        placement.y = std::max(0, (screen_height - placement.height) / 2);
    }
    return placement;
}

bool SizeLimits::apply(int width, int height, Hint hint)
{
    switch (hint)
    {
    case Hint::Max:
        max_ = Point{width, height};
        return false;
    case Hint::Min:
        min_ = Point{width, height};
        return false;
    case Hint::None:
    case Hint::Fixed:
        break;
    }
    return true;
}

bool SizeLimits::has_min() const noexcept
{
    return min_.x > 0 && min_.y > 0;
}

bool SizeLimits::has_max() const noexcept
{
    return max_.x > 0 && max_.y > 0;
}

Point SizeLimits::min() const noexcept
{
    return min_;
}

Point SizeLimits::max() const noexcept
{
    return max_;
}

bool is_resizable(Hint hint) noexcept
{
    return hint != Hint::Fixed;
}

} // namespace wv::app
