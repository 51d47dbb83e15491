#pragma once

#define SUNARC_NAMESPACE_BEGIN namespace sunarc {
#define SUNARC_NAMESPACE_END }

#define SUNARC_DELETE_COPY_CTOR_AND_ASSIGNMENT(class_name) \
  class_name(const class_name& other) = delete; \
  class_name& operator=(const class_name& other) = delete;

#define SUNARC_DEFAULT_MOVE_CTOR_AND_ASSIGNMENT_NOEXCEPT(class_name) \
  class_name(class_name&& other) noexcept = default; \
  class_name& operator=(class_name&& other) noexcept = default;
