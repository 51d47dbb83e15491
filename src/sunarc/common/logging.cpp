#include "logging.hpp"
#include "common.hpp"
#include "fs.hpp"
#include <iostream>
#include <ctime>
#include <string>

SUNARC_NAMESPACE_BEGIN

namespace {

Log* global_logger_instance = nullptr;
bool global_logger_is_default = false;

std::string time_now_as_string() {
  char buffer[128];
  std::time_t time_result = std::time(nullptr);
  const char* format = "%b %d %H:%M:%S";
  std::strftime(&buffer[0], 128, format, std::localtime(&time_result));
  return std::string(buffer);
}

bool meta_has_required_message_components(const Log::MetaData& meta) {
  return meta.tag && meta.function && meta.file;
}

std::string make_meta_string(const Log::MetaData& meta, const char* message) {
  std::string msg("[");
  msg += meta.tag;
  msg += "] ";

  if (meta_has_required_message_components(meta)) {
    msg += "(";
    msg += meta.function;
    msg += ", ";
    msg += meta.file_name_only ? fs::file_name(meta.file) : std::string{meta.file};
    msg += ":";
    msg += std::to_string(meta.line);
    msg += "): ";
  }

  msg += message;
  return msg;
}

} //  anon

const char* Log::level_string(Level level) {
  switch (level) {
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARNING";
    case Level::Error:
      return "ERROR";
    case Level::Severe:
      return "SEVERE";
  }
  return "";
}

/*
 * Meta
 */

Log::MetaData::MetaData(const char* tag, const char* func,
                        const char* file, int line) :
  tag(tag),
  function(func),
  file(file),
  line(line),
  file_name_only(true) {
  //
}

Log::MetaData::MetaData(const char* tag) :
  MetaData(tag, nullptr, nullptr, 0) {
  //
}

/*
 * Log
 */

void Log::write(Level level, const char* message) const {
  std::cout << time_now_as_string() << " | " << level_string(level) << ": "
            << message << std::endl;
}

void Log::dispatch(Level level, const char* message, const MetaData* meta) const {
  if (int(level) < int(min_level)) {
    return;
  }

  if (meta && meta->tag) {
    auto str = make_meta_string(*meta, message);
    write(level, str.c_str());
  } else {
    write(level, message);
  }
}

void Log::info(const char* message) const {
  dispatch(Level::Info, message, nullptr);
}

void Log::warning(const char* message) const {
  dispatch(Level::Warning, message, nullptr);
}

void Log::error(const char* message) const {
  dispatch(Level::Error, message, nullptr);
}

void Log::info(const char* message, const MetaData& meta) const {
  dispatch(Level::Info, message, &meta);
}

void Log::warning(const char* message, const MetaData& meta) const {
  dispatch(Level::Warning, message, &meta);
}

void Log::error(const char* message, const MetaData& meta) const {
  dispatch(Level::Error, message, &meta);
}

void Log::severe(const char* message, const MetaData& meta) const {
  dispatch(Level::Severe, message, &meta);
}

Log* Log::create_default_global_instance() {
  delete_default_global_instance();
  global_logger_instance = new Log();
  global_logger_is_default = true;
  return global_logger_instance;
}

Log* Log::require_global_instance() {
  if (global_logger_instance == nullptr) {
    return create_default_global_instance();
  }

  return global_logger_instance;
}

//  Only an instance created by `require_global_instance` is owned here.
void Log::delete_default_global_instance() {
  if (global_logger_is_default) {
    delete global_logger_instance;
    global_logger_instance = nullptr;
    global_logger_is_default = false;
  }
}

void Log::set_global_instance(Log* logger) {
  delete_default_global_instance();
  global_logger_instance = logger;
}

Log* Log::get_global_instance() {
  return global_logger_instance;
}

SUNARC_NAMESPACE_END
