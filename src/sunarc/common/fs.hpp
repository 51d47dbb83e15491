#pragma once

#include <string>

namespace sunarc {

namespace fs {

extern const char file_separator;

bool file_exists(const std::string& file_path);
std::string file_name(const std::string& file_path);

}

std::string read_text_file(const char* file_path, bool* success);

}
