#pragma once

#include "app_config.hpp"
#include "sunarc/common/Optional.hpp"
#include "sunarc/common/common.hpp"
#include <string>
#include <vector>
#include <functional>
#include <array>

SUNARC_NAMESPACE_BEGIN

namespace cmd {

struct MatchResult {
  bool success;
  int increment;
};

using MatchCallback = std::function<MatchResult(int, int, char**)>;

struct ParameterName {
  ParameterName();
  ParameterName(const char* full, const char* alias);
  ParameterName(const char* single);

  bool matches(const char* arg) const;
  std::string to_string() const;

  std::array<const char*, 2> alternates;
  int num_alternates;
};

struct Argument {
  Argument(const ParameterName& param, std::string description, MatchCallback cb);
  Argument(const ParameterName& param, const ParameterName& args,
           std::string description, MatchCallback cb);

  std::string to_string() const;

  ParameterName param;
  Optional<ParameterName> arguments;
  std::string description;
  MatchCallback match_callback;
};

struct Arguments {
  Arguments();
  bool parse(int argc, char** argv);
  void show_help() const;
  void show_usage() const;

private:
  bool evaluate() const;
  void build_argument_table();

private:
  std::vector<Argument> arguments;

public:
  bool had_parse_error{false};
  bool show_help_text{false};
  std::string validation_error;

  AppConfig config;
};

Optional<int> parse_int(const char* arg);
Optional<double> parse_double(const char* arg);

}

SUNARC_NAMESPACE_END
