#include "image.hpp"
#include "sunarc/visual/Image.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/common/logging.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include <stb_image.h>
#include <stb_image_write.h>
#include <cstring>
#include <string>

SUNARC_NAMESPACE_BEGIN

namespace {

[[maybe_unused]] constexpr const char* logging_id() {
  return "load/image";
}

} //  anon

Image<uint8_t> load_image(const char* file_path, bool* success, int req_components) {
  *success = false;

  int width;
  int height;
  int file_components;
  uint8_t* data = stbi_load(file_path, &width, &height, &file_components, req_components);

  if (!data) {
#if SUNARC_LOGGING_ENABLED == 1
    std::string msg{"Failed to load image: "};
    msg += file_path;
    msg += " (";
    msg += stbi_failure_reason();
    msg += ")";
    SUNARC_LOG_ERROR_CAPTURE_META(msg.c_str(), logging_id());
#endif
    return Image<uint8_t>();
  }

  const int num_components = req_components == 0 ? file_components : req_components;
  auto result = Image<uint8_t>::zeros(width, height, num_components);
  std::memcpy(result.ptr(), data, result.size());
  stbi_image_free(data);

  *success = true;
  return result;
}

bool write_image(const uint8_t* data, int w, int h, int num_components, const char* file_path) {
  auto res = stbi_write_png(file_path, w, h, num_components, data, w * num_components);
  if (res != 1) {
#if SUNARC_LOGGING_ENABLED == 1
    std::string msg{"Failed to write image: "};
    msg += file_path;
    SUNARC_LOG_ERROR_CAPTURE_META(msg.c_str(), logging_id());
#endif
    return false;
  }
  return true;
}

SUNARC_NAMESPACE_END
