#pragma once

#include <cstdint>

namespace sunarc {
template <typename T>
struct Image;

//  Decode any format stb_image understands (png, bmp, ...). `num_components` of 0
//  keeps the file's own channel count.
Image<uint8_t> load_image(const char* file_path, bool* success, int num_components = 0);

bool write_image(const uint8_t* image,
                 int w, int h, int num_components,
                 const char* file_path);
}
