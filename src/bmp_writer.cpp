#include "eegmon/bmp_writer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace eegmon {

static void write_u16(std::ofstream& f, uint16_t v) {
  f.put(static_cast<char>(v & 0xFF));
  f.put(static_cast<char>((v >> 8) & 0xFF));
}

static void write_u32(std::ofstream& f, uint32_t v) {
  f.put(static_cast<char>(v & 0xFF));
  f.put(static_cast<char>((v >> 8) & 0xFF));
  f.put(static_cast<char>((v >> 16) & 0xFF));
  f.put(static_cast<char>((v >> 24) & 0xFF));
}

void write_bmp24(const std::string& path, int width, int height, const std::vector<RGB>& pixels) {
  if (width <= 0 || height <= 0) throw std::runtime_error("write_bmp24: invalid dimensions");
  if (pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
    throw std::runtime_error("write_bmp24: pixels size mismatch");
  }

  std::ofstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open output BMP: " + path);

  const int row_stride = width * 3;
  const int padding = (4 - (row_stride % 4)) % 4;
  const uint32_t pixel_data_size = static_cast<uint32_t>((row_stride + padding) * height);
  const uint32_t file_size = 14 + 40 + pixel_data_size;

  // BITMAPFILEHEADER
  f.put('B'); f.put('M');                 // bfType
  write_u32(f, file_size);                // bfSize
  write_u16(f, 0); write_u16(f, 0);       // bfReserved1/2
  write_u32(f, 14 + 40);                  // bfOffBits

  // BITMAPINFOHEADER
  write_u32(f, 40);                       // biSize
  write_u32(f, static_cast<uint32_t>(width));  // biWidth
  write_u32(f, static_cast<uint32_t>(height)); // biHeight (positive => bottom-up)
  write_u16(f, 1);                        // biPlanes
  write_u16(f, 24);                       // biBitCount
  write_u32(f, 0);                        // biCompression (BI_RGB)
  write_u32(f, pixel_data_size);          // biSizeImage
  write_u32(f, 2835);                     // biXPelsPerMeter (~72 DPI)
  write_u32(f, 2835);                     // biYPelsPerMeter
  write_u32(f, 0);                        // biClrUsed
  write_u32(f, 0);                        // biClrImportant

  // Pixel data: BMP is BGR and bottom-up
  for (int y = height - 1; y >= 0; --y) {
    const RGB* row = &pixels[static_cast<size_t>(y) * static_cast<size_t>(width)];
    for (int x = 0; x < width; ++x) {
      const RGB& p = row[x];
      f.put(static_cast<char>(p.b));
      f.put(static_cast<char>(p.g));
      f.put(static_cast<char>(p.r));
    }
    for (int i = 0; i < padding; ++i) f.put(0);
  }

  if (!f) throw std::runtime_error("Failed to write BMP: " + path);
}

static double clamp01(double t) {
  if (t < 0.0) return 0.0;
  if (t > 1.0) return 1.0;
  return t;
}

RGB colormap_heat(double t01) {
  // 0.0: blue, 0.25: cyan, 0.5: green, 0.75: yellow, 1.0: red
  const double t = std::isnan(t01) ? 0.0 : clamp01(t01);

  auto lerp = [](double a, double b, double u) { return a + (b - a) * u; };

  struct Stop { double t; double r; double g; double b; };
  const Stop stops[] = {
    {0.00, 0.0, 0.0, 1.0},
    {0.25, 0.0, 1.0, 1.0},
    {0.50, 0.0, 1.0, 0.0},
    {0.75, 1.0, 1.0, 0.0},
    {1.00, 1.0, 0.0, 0.0},
  };

  const Stop* a = &stops[0];
  const Stop* b = &stops[4];
  for (int i = 0; i < 4; ++i) {
    if (t >= stops[i].t && t <= stops[i + 1].t) {
      a = &stops[i];
      b = &stops[i + 1];
      break;
    }
  }

  const double local = (b->t == a->t) ? 0.0 : (t - a->t) / (b->t - a->t);
  RGB out;
  out.r = static_cast<uint8_t>(std::round(255.0 * clamp01(lerp(a->r, b->r, local))));
  out.g = static_cast<uint8_t>(std::round(255.0 * clamp01(lerp(a->g, b->g, local))));
  out.b = static_cast<uint8_t>(std::round(255.0 * clamp01(lerp(a->b, b->b, local))));
  return out;
}

Canvas::Canvas(int w, int h, const RGB& fill) : width(w), height(h) {
  if (w <= 0 || h <= 0) throw std::runtime_error("Canvas: invalid dimensions");
  pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), fill);
}

void Canvas::set_pixel(int x, int y, const RGB& c) {
  if (x < 0 || y < 0 || x >= width || y >= height) return;
  pixels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)] = c;
}

void Canvas::draw_line(int x0, int y0, int x1, int y1, const RGB& c) {
  // Integer Bresenham
  const int dx = std::abs(x1 - x0);
  const int sx = (x0 < x1) ? 1 : -1;
  const int dy = -std::abs(y1 - y0);
  const int sy = (y0 < y1) ? 1 : -1;
  int err = dx + dy;

  while (true) {
    set_pixel(x0, y0, c);
    if (x0 == x1 && y0 == y1) break;
    const int e2 = 2 * err;
    if (e2 >= dy) { err += dy; x0 += sx; }
    if (e2 <= dx) { err += dx; y0 += sy; }
  }
}

void Canvas::draw_dashed_hline(int x0, int x1, int y, const RGB& c, int on, int off) {
  if (x1 < x0) std::swap(x0, x1);
  on = std::max(1, on);
  off = std::max(0, off);
  const int period = on + off;
  for (int x = x0; x <= x1; ++x) {
    if ((x - x0) % period < on) set_pixel(x, y, c);
  }
}

void Canvas::draw_dashed_vline(int x, int y0, int y1, const RGB& c, int on, int off) {
  if (y1 < y0) std::swap(y0, y1);
  on = std::max(1, on);
  off = std::max(0, off);
  const int period = on + off;
  for (int y = y0; y <= y1; ++y) {
    if ((y - y0) % period < on) set_pixel(x, y, c);
  }
}

void Canvas::draw_rect_border(int x0, int y0, int rw, int rh, const RGB& c) {
  if (rw <= 0 || rh <= 0) return;
  for (int x = x0; x < x0 + rw; ++x) {
    set_pixel(x, y0, c);
    set_pixel(x, y0 + rh - 1, c);
  }
  for (int y = y0; y < y0 + rh; ++y) {
    set_pixel(x0, y, c);
    set_pixel(x0 + rw - 1, y, c);
  }
}

namespace {

// Each glyph is 7 rows of 5 bits stored in the low bits of each byte.
struct GlyphDef {
  char ch;
  uint8_t rows[7];
};

const GlyphDef kGlyphs[] = {
  {'0', {0x0E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}},
  {'1', {0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E}},
  {'2', {0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}},
  {'3', {0x0E, 0x11, 0x01, 0x06, 0x01, 0x11, 0x0E}},
  {'4', {0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}},
  {'5', {0x1F, 0x10, 0x1E, 0x01, 0x01, 0x11, 0x0E}},
  {'6', {0x06, 0x08, 0x10, 0x1E, 0x11, 0x11, 0x0E}},
  {'7', {0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08}},
  {'8', {0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}},
  {'9', {0x0E, 0x11, 0x11, 0x0F, 0x01, 0x02, 0x0C}},

  {'.', {0x00, 0x00, 0x00, 0x00, 0x00, 0x04, 0x04}},
  {'-', {0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00}},
  {'+', {0x00, 0x04, 0x04, 0x1F, 0x04, 0x04, 0x00}},

  // Scientific notation
  {'e', {0x00, 0x0E, 0x11, 0x1F, 0x10, 0x11, 0x0E}},
  {'E', {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}},

  // Band initials
  {'D', {0x1E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x1E}},
  {'T', {0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}},
  {'A', {0x0E, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
  {'B', {0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E}},
  {'G', {0x0E, 0x11, 0x10, 0x17, 0x11, 0x11, 0x0F}},

  {'n', {0x00, 0x00, 0x1E, 0x11, 0x11, 0x11, 0x11}},
  {'a', {0x00, 0x0E, 0x01, 0x0F, 0x11, 0x11, 0x0F}},
  {'i', {0x04, 0x00, 0x0C, 0x04, 0x04, 0x04, 0x0E}},
  {'f', {0x06, 0x09, 0x08, 0x1C, 0x08, 0x08, 0x08}},

  {' ', {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
};

const uint8_t* glyph_rows(char ch) {
  for (const auto& g : kGlyphs) {
    if (g.ch == ch) return g.rows;
  }
  const char low = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (low != ch) {
    for (const auto& g : kGlyphs) {
      if (g.ch == low) return g.rows;
    }
  }
  return nullptr;
}

std::string format_compact(double v) {
  if (!std::isfinite(v)) {
    return std::isnan(v) ? std::string("nan") : std::string("inf");
  }
  char buf[64];
  // 5 significant digits, switches to scientific as needed.
  std::snprintf(buf, sizeof(buf), "%.5g", v);
  return std::string(buf);
}

} // namespace

void Canvas::draw_text(int x0, int y0, const std::string& text, const RGB& c, int scale) {
  scale = std::max(1, scale);
  const int adv = (5 + 1) * scale;
  const int line_h = (7 + 1) * scale;

  int x = x0;
  int y = y0;
  for (char ch : text) {
    if (ch == '\n') {
      y += line_h;
      x = x0;
      continue;
    }
    const uint8_t* rows = glyph_rows(ch);
    if (rows) {
      for (int r = 0; r < 7; ++r) {
        for (int col = 0; col < 5; ++col) {
          if ((rows[r] & (1u << (4 - col))) == 0) continue;
          for (int sy = 0; sy < scale; ++sy) {
            for (int sx = 0; sx < scale; ++sx) {
              set_pixel(x + col * scale + sx, y + r * scale + sy, c);
            }
          }
        }
      }
    }
    x += adv;
  }
}

void write_bmp24_with_vertical_colorbar(const std::string& path,
                                        const Canvas& image,
                                        double vmin,
                                        double vmax,
                                        const VerticalColorbarOptions& opt) {
  const int img_w = image.width;
  const int img_h = image.height;
  if (img_w <= 0 || img_h <= 0) {
    throw std::runtime_error("write_bmp24_with_vertical_colorbar: invalid dimensions");
  }
  if (image.pixels.size() != static_cast<size_t>(img_w) * static_cast<size_t>(img_h)) {
    throw std::runtime_error("write_bmp24_with_vertical_colorbar: pixels size mismatch");
  }

  if (!opt.enabled) {
    write_bmp24(path, img_w, img_h, image.pixels);
    return;
  }

  const std::string label_top = format_compact(vmax);
  const std::string label_bottom = format_compact(vmin);

  const int pad_left = std::max(0, opt.pad_left);
  const int pad_right = std::max(0, opt.pad_right);
  const int pad_top = std::max(0, opt.pad_top);
  const int pad_bottom = std::max(0, opt.pad_bottom);
  const int gap = std::max(0, opt.gap);
  const int bar_w = std::max(2, opt.bar_width);
  const int scale = std::max(1, opt.font_scale);

  const int char_adv = (5 + 1) * scale;
  const int font_h = 7 * scale;

  int label_w = 0;
  if (opt.draw_labels) {
    const size_t max_len = std::max(label_top.size(), label_bottom.size());
    label_w = static_cast<int>(max_len) * char_adv + 4;
  }
  const int extra_label_block = (opt.draw_labels ? (gap + label_w) : 0);

  Canvas out(pad_left + img_w + gap + bar_w + extra_label_block + pad_right,
             pad_top + img_h + pad_bottom,
             RGB{255, 255, 255});

  const int x_img = pad_left;
  const int y_img = pad_top;
  const int x_bar = pad_left + img_w + gap;
  const int y_bar = pad_top;
  const int x_label = x_bar + bar_w + gap;

  for (int y = 0; y < img_h; ++y) {
    for (int x = 0; x < img_w; ++x) {
      out.set_pixel(x_img + x, y_img + y,
                    image.pixels[static_cast<size_t>(y) * static_cast<size_t>(img_w) + static_cast<size_t>(x)]);
    }
  }

  // vmax at top, vmin at bottom
  const double denom = (img_h <= 1) ? 1.0 : static_cast<double>(img_h - 1);
  for (int y = 0; y < img_h; ++y) {
    const RGB c = colormap_heat(1.0 - static_cast<double>(y) / denom);
    for (int x = 0; x < bar_w; ++x) out.set_pixel(x_bar + x, y_bar + y, c);
  }
  out.draw_rect_border(x_bar, y_bar, bar_w, img_h, opt.border_color);

  if (opt.draw_labels) {
    const int y_label_top = std::max(0, (pad_top - font_h) / 2);
    const int y_label_bottom = pad_top + img_h + std::max(0, (pad_bottom - font_h) / 2);
    out.draw_text(x_label, y_label_top, label_top, opt.text_color, scale);
    out.draw_text(x_label, y_label_bottom, label_bottom, opt.text_color, scale);
  }

  write_bmp24(path, out.width, out.height, out.pixels);
}

} // namespace eegmon
