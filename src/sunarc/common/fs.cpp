#include "fs.hpp"
#include "sunarc/common/common.hpp"
#include "sunarc/common/platform.hpp"
#include <fstream>
#include <sstream>

#if defined(SUNARC_UNIX)
#include <sys/stat.h>
#elif defined(SUNARC_WIN)
#include <windows.h>
#endif

SUNARC_NAMESPACE_BEGIN

#ifdef SUNARC_UNIX
const char fs::file_separator = '/';
#else
const char fs::file_separator = '\\';
#endif

#if defined(SUNARC_UNIX)
bool fs::file_exists(const std::string& path) {
  struct stat sb;
  if (stat(path.c_str(), &sb) != 0) {
    return false;
  }
  return (sb.st_mode & S_IFMT) == S_IFREG;
}
#elif defined(SUNARC_WIN)
bool fs::file_exists(const std::string& path) {
  return !(INVALID_FILE_ATTRIBUTES == GetFileAttributes(path.c_str()) &&
         GetLastError() == ERROR_FILE_NOT_FOUND);
}
#else
#error "Expected one of Unix or Windows for OS."
#endif

std::string fs::file_name(const std::string& file_path) {
  auto last_sep = file_path.find_last_of(file_separator);
  if (last_sep == std::string::npos) {
    return file_path;
  }
  return file_path.substr(last_sep + 1);
}

std::string read_text_file(const char* file_path, bool* success) {
  *success = false;

  std::ifstream file(file_path);
  if (!file) {
    return "";
  }

  std::stringstream file_stream;
  file_stream << file.rdbuf();
  if (file.bad()) {
    return "";
  }

  *success = true;
  return file_stream.str();
}

SUNARC_NAMESPACE_END
