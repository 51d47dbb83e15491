#include "command_line.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <iostream>

SUNARC_NAMESPACE_BEGIN

namespace cmd {

namespace {
  bool matches(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
  }

  bool is_argument(const char* a) {
    return std::strlen(a) > 0 && a[0] == '-';
  }

  bool has_value(int i, int argc) {
    return i < argc - 1;
  }

  MatchCallback int_option(int* out) {
    return [out](int i, int argc, char** argv) {
      if (!has_value(i, argc)) {
        return MatchResult{false, 1};
      }
      auto v = parse_int(argv[i + 1]);
      if (v) {
        *out = v.value();
      }
      return MatchResult{v.has_value(), 2};
    };
  }

  MatchCallback double_option(double* out) {
    return [out](int i, int argc, char** argv) {
      if (!has_value(i, argc)) {
        return MatchResult{false, 1};
      }
      auto v = parse_double(argv[i + 1]);
      if (v) {
        *out = v.value();
      }
      return MatchResult{v.has_value(), 2};
    };
  }

  MatchCallback string_option(std::string* out) {
    return [out](int i, int argc, char** argv) {
      if (!has_value(i, argc)) {
        return MatchResult{false, 1};
      }
      *out = argv[i + 1];
      return MatchResult{true, 2};
    };
  }

  MatchCallback flag(bool* out, bool value = true) {
    return [out, value](int, int, char**) {
      *out = value;
      return MatchResult{true, 1};
    };
  }
}

Optional<int> parse_int(const char* arg) {
  char* end{};
  errno = 0;
  long v = std::strtol(arg, &end, 10);
  if (end == arg || *end != '\0' || errno == ERANGE || v < long(std::numeric_limits<int>::min()) ||
      v > long(std::numeric_limits<int>::max())) {
    return NullOpt{};
  }
  return Optional<int>(int(v));
}

Optional<double> parse_double(const char* arg) {
  char* end{};
  errno = 0;
  double v = std::strtod(arg, &end);
  if (end == arg || *end != '\0' || errno == ERANGE) {
    return NullOpt{};
  }
  return Optional<double>(v);
}

/*
* ParameterName
*/

ParameterName::ParameterName() : alternates{}, num_alternates(0) {
  //
}
ParameterName::ParameterName(const char* full, const char* alias) :
  alternates{{full, alias}}, num_alternates(2) {
  //
}
ParameterName::ParameterName(const char* single) :
  alternates{{single}}, num_alternates(1) {
  //
}

bool ParameterName::matches(const char* arg) const {
  for (int i = 0; i < num_alternates; i++) {
    if (cmd::matches(arg, alternates[i])) {
      return true;
    }
  }
  return false;
}

std::string ParameterName::to_string() const {
  std::string res;
  for (int i = 0; i < num_alternates; i++) {
    res += alternates[i];
    if (i < num_alternates-1) {
      res += ", ";
    }
  }
  return res;
}

/*
* Argument
*/

Argument::Argument(const ParameterName& param,
                   std::string description,
                   MatchCallback cb) :
  param(param),
  description(std::move(description)),
  match_callback(std::move(cb)) {
  //
}
Argument::Argument(const ParameterName& param,
                   const ParameterName& args,
                   std::string description,
                   MatchCallback cb) :
  param(param),
  arguments(Optional<ParameterName>(args)),
  description(std::move(description)),
  match_callback(std::move(cb)) {
  //
}

std::string Argument::to_string() const {
  std::string str = "  " + param.to_string();
  if (arguments) {
    str += " ";
    str += arguments.value().to_string();
  }

  str += ": ";
  str += "\n      " + description;

  return str;
}

/*
* Arguments
*/

Arguments::Arguments() = default;

void Arguments::show_help() const {
  std::cout << std::endl;
  show_usage();
  std::cout << std::endl << "options: " << std::endl;

  for (const auto& arg : arguments) {
    std::cout << arg.to_string() << std::endl;
  }

  std::cout << std::endl;
}

void Arguments::show_usage() const {
  std::cout << "Usage: sunarc-matrix [options]" << std::endl;
}

void Arguments::build_argument_table() {
  arguments.clear();
  arguments.emplace_back(ParameterName("--help", "-h"), "Show this text.",
    flag(&show_help_text));
  arguments.emplace_back(ParameterName("--weather-interval", "-wi"), ParameterName("<seconds>"),
    "Seconds between weather fetches.",
    double_option(&config.weather_update_interval_s));
  arguments.emplace_back(ParameterName("--display-interval", "-di"), ParameterName("<seconds>"),
    "Seconds between redraws.",
    double_option(&config.display_update_interval_s));
  arguments.emplace_back(ParameterName("--utc-offset", "-u"), ParameterName("<hours>"),
    "Local time offset from UTC.",
    int_option(&config.utc_offset_hours));
  arguments.emplace_back(ParameterName("--width", "-w"), ParameterName("<pixels>"),
    "Panel width.",
    int_option(&config.display_width));
  arguments.emplace_back(ParameterName("--height", "-he"), ParameterName("<pixels>"),
    "Panel height.",
    int_option(&config.display_height));
  arguments.emplace_back(ParameterName("--temp-min", "-tmin"), ParameterName("<degrees F>"),
    "Coldest temperature of the color gradient.",
    double_option(&config.gradient_temp_min));
  arguments.emplace_back(ParameterName("--temp-max", "-tmax"), ParameterName("<degrees F>"),
    "Hottest temperature of the color gradient.",
    double_option(&config.gradient_temp_max));
  arguments.emplace_back(ParameterName("--fake", "-f"),
    "Use the built-in sample response instead of a weather file.",
    flag(&config.use_fixture_data));
  arguments.emplace_back(ParameterName("--weather-file", "-wf"), ParameterName("<path>"),
    "OpenWeather one-call JSON document to read on every fetch.",
    string_option(&config.weather_file_path));
  arguments.emplace_back(ParameterName("--icons", "-i"), ParameterName("<path>"),
    "Weather icon sprite sheet (16x16 tiles, day / night columns).",
    string_option(&config.icon_atlas_path));
  arguments.emplace_back(ParameterName("--frame-out", "-o"), ParameterName("<path>"),
    "Write every frame to this PNG file.",
    string_option(&config.frame_output_path));
  arguments.emplace_back(ParameterName("--window", "-win"),
    "Show the panel in a preview window.",
    flag(&config.show_preview_window));
  arguments.emplace_back(ParameterName("--terminal", "-t"),
    "Draw the panel in the terminal.",
    flag(&config.show_terminal_preview));
  arguments.emplace_back(ParameterName("--scale", "-s"), ParameterName("<factor>"),
    "Preview window pixels per panel pixel.",
    int_option(&config.preview_window_scale));
  arguments.emplace_back(ParameterName("--tick", "-dt"), ParameterName("<seconds>"),
    "Control loop period.",
    double_option(&config.tick_interval_s));
  arguments.emplace_back(ParameterName("--ticks", "-n"), ParameterName("<count>"),
    "Stop after this many ticks (0 runs forever).",
    int_option(&config.max_num_ticks));
  arguments.emplace_back(ParameterName("--24h"),
    "Use a 24-hour clock.",
    flag(&config.use_24_hour_clock));
  arguments.emplace_back(ParameterName("--quiet", "-q"),
    "Only log warnings and errors.",
    flag(&config.quiet));
}

bool Arguments::parse(int argc, char** argv) {
  build_argument_table();

  int i = 1;  //  skip executable.

  while (i < argc) {
    int incr = 1;
    const char* arg = argv[i];
    const bool is_arg = is_argument(arg);
    bool any_matched = false;
    bool parse_success = true;

    for (const auto& to_match : arguments) {
      if (to_match.param.matches(arg)) {
        auto res = to_match.match_callback(i, argc, argv);
        incr = res.increment;
        any_matched = true;
        had_parse_error = had_parse_error || !res.success;
        parse_success = res.success;
        break;
      }
    }

    if (!any_matched && is_arg) {
      std::cout << "Unrecognized or invalid argument: " << arg << ".";
      std::cout << " Try --help." << std::endl;
      had_parse_error = true;

    } else if (!any_matched) {
      std::cout << "Unexpected positional argument: " << arg << ".";
      std::cout << " Try --help." << std::endl;
      had_parse_error = true;

    } else if (!parse_success) {
      std::cout << "Invalid value for argument: " << arg << ".";
      std::cout << " Try --help." << std::endl;
    }

    i += incr;
  }

  if (!had_parse_error && !show_help_text) {
    validation_error = validate(config);
    if (!validation_error.empty()) {
      std::cout << "Invalid configuration: " << validation_error << std::endl;
      had_parse_error = true;
    }
  }

  return evaluate();
}

bool Arguments::evaluate() const {
  if (had_parse_error) {
    return false;

  } else if (show_help_text) {
    show_help();
    return false;
  }

  return true;
}

}

SUNARC_NAMESPACE_END
