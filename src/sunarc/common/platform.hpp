#pragma once

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
  #define SUNARC_WIN
#elif __APPLE__
  #define SUNARC_MACOS
  #define SUNARC_UNIX
#elif __linux__ || __unix__
  #define SUNARC_LINUX
  #define SUNARC_UNIX
#endif
