#pragma once

#include "sunarc/common/common.hpp"
#include <cstddef>
#include <memory>

namespace sunarc {
  template <typename T>
  struct Image;
}

//  Tightly packed, row-major, interleaved pixel data; row 0 is the top row.
template <typename T>
struct sunarc::Image {
  std::unique_ptr<T[]> data;
  int width;
  int height;
  int num_components_per_pixel;

  Image(std::unique_ptr<T[]> data, int width, int height, int num_components) :
    data(std::move(data)),
    width(width),
    height(height),
    num_components_per_pixel(num_components) {
    //
  }

  Image() : Image(nullptr, 0, 0, 0) {
    //
  }

  SUNARC_DELETE_COPY_CTOR_AND_ASSIGNMENT(Image)
  SUNARC_DEFAULT_MOVE_CTOR_AND_ASSIGNMENT_NOEXCEPT(Image)

  static Image<T> zeros(int width, int height, int num_components) {
    const auto n = std::size_t(width) * height * num_components;
    return Image<T>(std::make_unique<T[]>(n), width, height, num_components);
  }

  size_t size() const {
    return size_t(width) * height * num_components_per_pixel;
  }

  bool empty() const {
    return data == nullptr || size() == 0;
  }

  int stride() const {
    return num_components_per_pixel;
  }

  bool contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < width && y < height;
  }

  size_t pixel_offset(int x, int y) const {
    return (size_t(y) * width + x) * num_components_per_pixel;
  }

  T* ptr() {
    return data.get();
  }

  const T* ptr() const {
    return data.get();
  }
};
