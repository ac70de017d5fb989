#ifndef COMMON_H
#define COMMON_H

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

template <typename T1, typename... TS>
auto with_formatting(const std::string &code, const T1 &first, TS... args)
  -> std::string {
    return code + fmt::format(fmt::runtime(fmt::format("{}", first)), args...)
           + "\033[0m";
}

template <typename... T>
auto bold(T... args) -> std::string {
    return with_formatting("\033[1m", args...);
}
template <typename... T>
auto red(T... args) -> std::string {
    return with_formatting("\033[31m", args...);
}
template <typename... T>
auto green(T... args) -> std::string {
    return with_formatting("\033[32m", args...);
}
template <typename... T>
auto gray(T... args) -> std::string {
    return with_formatting("\033[37m", args...);
}
template <typename... T>
auto yellow(T... args) -> std::string {
    return with_formatting("\033[33m", args...);
}

/// True for samples that carry no intensity (NaN for floating point data)
template <typename T>
bool is_missing(T value) {
    if constexpr (std::is_floating_point<T>::value) {
        return std::isnan(value);
    } else {
        return false;
    }
}

/// Draw a subset of the values of a row-major 2D array
/// fast, slow, width, height - describe the bounding box to draw
/// data_width, data_height - describe the full data array size
template <typename T>
void draw_image_data(const T *data,
                     size_t fast,
                     size_t slow,
                     size_t width,
                     size_t height,
                     size_t data_width,
                     size_t data_height) {
    std::string format_type = std::is_integral<T>::value ? "d" : ".1f";
    width = std::min(width, data_width - std::min(fast, data_width));

    // Maximum value and format width for each column
    T accum = 0;
    std::vector<size_t> col_widths;
    for (size_t col = fast; col < fast + width; ++col) {
        size_t maxw = fmt::formatted_size("{:3}", col);
        for (size_t row = slow; row < std::min(slow + height, data_height); ++row) {
            auto val = data[col + data_width * row];
            if (is_missing(val)) continue;
            auto fmt_spec = fmt::format("{{:{}}}", format_type);
            maxw = std::max(maxw, fmt::formatted_size(fmt::runtime(fmt_spec), val));
            accum = std::max(accum, val);
        }
        col_widths.push_back(maxw);
    }
    bool is_top = slow == 0;
    bool is_left = fast == 0;
    bool is_right = fast + width >= data_width;

    // Draw a row header
    fmt::print("x =       ");
    for (size_t i = 0; i < width; ++i) {
        fmt::print("{:{}} ", i + fast, col_widths[i]);
    }
    fmt::print("\n         ");
    if (is_top) {
        fmt::print("{}", is_left ? "╔" : "╒");
    } else {
        fmt::print("{}", is_left ? "╓" : "┌");
    }
    for (size_t i = 0; i < width; ++i) {
        for (size_t j = 0; j <= col_widths[i]; ++j) {
            fmt::print("{}", is_top ? "═" : "─");
        }
    }
    if (is_top) {
        fmt::print("{}", is_right ? "╗" : "╕");
    } else {
        fmt::print("{}", is_right ? "╖" : "┐");
    }
    fmt::print("\n");
    for (size_t y = slow; y < std::min(slow + height, data_height); ++y) {
        fmt::print("{} {:4d} {}", y == slow ? "y =" : "   ", y, is_left ? "║" : "│");
        for (size_t i = fast; i < fast + width; ++i) {
            auto dat = data[i + data_width * y];
            if (is_missing(dat)) {
                fmt::print("\033[38;5;240m{:>{}} \033[0m", "-", col_widths[i - fast]);
                continue;
            }
            // Black, 232->255, White
            // Range of 24 colors, not including white. Split into 25 bins, so
            // that we have a whole black top bin
            int color = accum == 0 ? 255 : 255 - (double(dat) / double(accum)) * 24;
            if (color <= 231) color = 0;
            if (dat < 0) color = 9;
            if (dat == accum && accum != 0) {
                fmt::print("\033[0m\033[1m");
            } else {
                fmt::print("\033[38;5;{}m", color);
            }
            auto fmt_spec =
              fmt::format("{{:{}{}}} ", col_widths[i - fast], format_type);
            fmt::print(fmt::runtime(fmt_spec), dat);
            fmt::print("\033[0m");
        }
        fmt::print("{}\n", is_right ? "║" : "│");
    }
}
template <typename T>
void draw_image_data(const std::span<T> data,
                     size_t fast,
                     size_t slow,
                     size_t width,
                     size_t height,
                     size_t data_width,
                     size_t data_height) {
    draw_image_data(data.data(), fast, slow, width, height, data_width, data_height);
}

#endif
