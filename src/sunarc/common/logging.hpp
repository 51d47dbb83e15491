#pragma once

#include "sunarc/common/config.hpp"

namespace sunarc {
  class Log;
}

class sunarc::Log {
public:
  enum class Level {
    Info = 0,
    Warning,
    Error,
    Severe
  };

  static const char* level_string(Level level);

  class MetaData {
  public:
    MetaData() = delete;
    MetaData(const char* tag);
    MetaData(const char* tag, const char* func, const char* file, int line);

  public:
    const char* tag;
    const char* function;
    const char* file;
    int line;
    bool file_name_only;
  };

public:
  virtual ~Log() = default;

  void info(const char* message) const;
  void warning(const char* message) const;
  void error(const char* message) const;

  void info(const char* message, const MetaData& meta) const;
  void warning(const char* message, const MetaData& meta) const;
  void error(const char* message, const MetaData& meta) const;
  void severe(const char* message, const MetaData& meta) const;

  void set_min_level(Level level) {
    min_level = level;
  }
  Level get_min_level() const {
    return min_level;
  }

  static void delete_default_global_instance();
  static void set_global_instance(Log* logger);
  static Log* get_global_instance();
  static Log* require_global_instance();

protected:
  //  Subclasses redirect output here; `message` already carries any metadata prefix.
  virtual void write(Level level, const char* message) const;

private:
  void dispatch(Level level, const char* message, const MetaData* meta) const;
  static Log* create_default_global_instance();

private:
  Level min_level{Level::Info};
};

#if SUNARC_LOGGING_ENABLED == 1
#define SUNARC_LOG_ERROR_CAPTURE_META(message, tag) \
  sunarc::Log::require_global_instance()->error((message), \
    sunarc::Log::MetaData((tag), __func__, __FILE__, __LINE__))
#define SUNARC_LOG_INFO_CAPTURE_META(message, tag) \
  sunarc::Log::require_global_instance()->info((message), \
    sunarc::Log::MetaData((tag), __func__, __FILE__, __LINE__))
#define SUNARC_LOG_WARNING_CAPTURE_META(message, tag) \
  sunarc::Log::require_global_instance()->warning((message), \
    sunarc::Log::MetaData((tag), __func__, __FILE__, __LINE__))

#define SUNARC_LOG_ERROR(message) \
  sunarc::Log::require_global_instance()->error((message))
#define SUNARC_LOG_INFO(message) \
  sunarc::Log::require_global_instance()->info((message))
#define SUNARC_LOG_WARNING(message) \
  sunarc::Log::require_global_instance()->warning((message))
#else
#define SUNARC_LOG_ERROR(message) \
  do {} while (0)
#define SUNARC_LOG_INFO(message) \
  do {} while (0)
#define SUNARC_LOG_WARNING(message) \
  do {} while (0)

#define SUNARC_LOG_ERROR_CAPTURE_META(message, tag) \
  do {} while (0)
#define SUNARC_LOG_INFO_CAPTURE_META(message, tag) \
  do {} while (0)
#define SUNARC_LOG_WARNING_CAPTURE_META(message, tag) \
  do {} while (0)
#endif

#define SUNARC_LOG_SEVERE_CAPTURE_META(message, tag) \
  sunarc::Log::require_global_instance()->severe((message), \
    sunarc::Log::MetaData((tag), __func__, __FILE__, __LINE__))
