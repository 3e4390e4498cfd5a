#pragma once

#include "eegmon/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace eegmon {

// Write a 24-bit BMP.
// Pixels are row-major, top-to-bottom, left-to-right.
// Size must be width*height.
void write_bmp24(const std::string& path, int width, int height, const std::vector<RGB>& pixels);

// Simple "blue->cyan->green->yellow->red" gradient colormap.
RGB colormap_heat(double t01);

// A pixel buffer with a few drawing primitives. Drawing outside the canvas
// is clipped.
struct Canvas {
  int width{0};
  int height{0};
  std::vector<RGB> pixels;  // row-major, top-to-bottom

  Canvas() = default;
  Canvas(int w, int h, const RGB& fill);

  void set_pixel(int x, int y, const RGB& c);
  void draw_line(int x0, int y0, int x1, int y1, const RGB& c);

  // Dashed horizontal/vertical lines: `on` pixels drawn, `off` skipped.
  void draw_dashed_hline(int x0, int x1, int y, const RGB& c, int on = 4, int off = 3);
  void draw_dashed_vline(int x, int y0, int y1, const RGB& c, int on = 4, int off = 3);

  void draw_rect_border(int x0, int y0, int rw, int rh, const RGB& c);

  // Tiny built-in 5x7 font: digits, '.', '-', '+', 'e', 'E', and the band
  // initials D T A B G. Unknown characters render as blanks.
  void draw_text(int x0, int y0, const std::string& text, const RGB& c, int scale = 1);
};

// Options for composing an output BMP with a vertical colorbar (right side).
struct VerticalColorbarOptions {
  bool enabled{true};

  // Layout around the source image.
  int pad_left{4};
  int pad_right{4};
  int pad_top{20};     // also provides space for top label text
  int pad_bottom{20};  // also provides space for bottom label text

  // Colorbar geometry.
  int bar_width{16};
  int gap{6};          // gap between image <-> bar, and bar <-> labels

  bool draw_labels{true};
  int font_scale{2};

  RGB text_color{0, 0, 0};
  RGB border_color{0, 0, 0};
};

// Write an image with a right-side vertical colorbar, using the heat colormap.
// `vmin/vmax` are the numeric limits shown in the labels.
void write_bmp24_with_vertical_colorbar(const std::string& path,
                                        const Canvas& image,
                                        double vmin,
                                        double vmax,
                                        const VerticalColorbarOptions& opt = VerticalColorbarOptions{});

} // namespace eegmon
