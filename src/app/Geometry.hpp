#pragma once

#include "app/Options.hpp"

namespace wv::app
{

inline constexpr int kDefaultWidth = 640;
inline constexpr int kDefaultHeight = 480;

struct Point
{
    int x = 0;
    int y = 0;
};

struct Placement
{
    int x = 0;
    int y = 0;
    int width = kDefaultWidth;
    int height = kDefaultHeight;
    // Let the window manager pick x and y.
    bool default_position = true;
};

// Initial window rectangle for `options` on a screen of the given size.
// Centred windows larger than the screen are pinned to the top-left corner.
Placement compute_placement(WindowOptions const &options, int screen_width,
                            int screen_height);

// Min/max track sizes recorded by set_size() and enforced while the user
// resizes the window. A zero component means "no limit".
class SizeLimits
{
  public:
    // Records a Min or Max hint. Returns true when the window itself has to
    // be resized (None and Fixed).
    bool apply(int width, int height, Hint hint);

    bool has_min() const noexcept;
    bool has_max() const noexcept;
    Point min() const noexcept;
    Point max() const noexcept;

  private:
    Point min_;
    Point max_;
};

// Whether the frame keeps its sizing border and maximize box.
bool is_resizable(Hint hint) noexcept;

} // namespace wv::app
