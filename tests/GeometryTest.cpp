#include "app/Geometry.hpp"

#include <doctest/doctest.h>

TEST_CASE("zero size selects the default window size")
{
    wv::app::WindowOptions options;
    auto placement = wv::app::compute_placement(options, 1920, 1080);
    CHECK(placement.width == wv::app::kDefaultWidth);
    CHECK(placement.height == wv::app::kDefaultHeight);
    CHECK(placement.default_position);
}

TEST_CASE("centred windows sit in the middle of the screen")
{
    wv::app::WindowOptions options;
    options.width = 800;
    options.height = 600;
    options.center = true;
    auto placement = wv::app::compute_placement(options, 1920, 1080);
    CHECK_FALSE(placement.default_position);
    CHECK(placement.x == 560);
    CHECK(placement.y == 240);
    CHECK(placement.width == 800);
    CHECK(placement.height == 600);
}

TEST_CASE("centring a window larger than the screen clamps at zero")
{
    wv::app::WindowOptions options;
    options.width = 2000;
    options.height = 300;
    options.center = true;
    auto placement = wv::app::compute_placement(options, 1280, 720);
    CHECK(placement.x == 0);
    CHECK(placement.y == 210);
}

TEST_CASE("size hints record limits or request a resize")
{
    wv::app::SizeLimits limits;
    CHECK_FALSE(limits.has_min());
    CHECK_FALSE(limits.has_max());

    CHECK_FALSE(limits.apply(320, 200, wv::app::Hint::Min));
    CHECK(limits.has_min());
    CHECK(limits.min().x == 320);
    CHECK(limits.min().y == 200);

    CHECK_FALSE(limits.apply(1024, 0, wv::app::Hint::Max));
    CHECK_FALSE(limits.has_max());

    CHECK(limits.apply(640, 480, wv::app::Hint::None));
    CHECK(limits.apply(640, 480, wv::app::Hint::Fixed));
    CHECK(limits.min().x == 320);
}

TEST_CASE("only fixed windows lose their sizing frame")
{
    CHECK(wv::app::is_resizable(wv::app::Hint::None));
    CHECK(wv::app::is_resizable(wv::app::Hint::Min));
    CHECK(wv::app::is_resizable(wv::app::Hint::Max));
    CHECK_FALSE(wv::app::is_resizable(wv::app::Hint::Fixed));
}
