//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/cli_options.hpp"

#include <charconv>
#include <format>

namespace imxup {
namespace {
auto ParseInt(const std::string& flag, const std::string& text, int32_t min, int32_t max)
    -> int32_t {
  int32_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size() || value < min || value > max) {
    throw CliError(std::format("{} expects a number from {} to {}, got '{}'", flag, min, max,
                               text));
  }
  return value;
}
}  // namespace

auto ParseCliArgs(const std::vector<std::string>& args) -> CliOptions {
  CliOptions                 options;
  std::optional<std::string> pending_name;

  auto value_of = [&](size_t& i) -> const std::string& {
    if (i + 1 >= args.size()) throw CliError(args[i] + " needs a value");
    return args[++i];
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      options.help_ = true;
    } else if (arg == "--version" || arg == "-v") {
      options.version_ = true;
    } else if (arg == "--gui") {
      options.gui_ = true;
    } else if (arg == "--debug") {
      options.debug_ = true;
    } else if (arg == "--config") {
      options.config_ = value_of(i);
    } else if (arg == "--thumb-size") {
      options.thumb_size_ = ParseInt(arg, value_of(i), 1, 6);
    } else if (arg == "--content-type") {
      options.content_type_ = ParseInt(arg, value_of(i), 0, 1);
    } else if (arg == "--name") {
      const auto& name = value_of(i);
      if (!options.galleries_.empty() && options.galleries_.back().name_.empty()) {
        options.galleries_.back().name_ = name;
      } else if (!pending_name) {
        pending_name = name;
      } else {
        throw CliError("--name given twice for the same folder");
      }
    } else if (arg.starts_with("--")) {
      throw CliError("Unknown option " + arg);
    } else {
      options.galleries_.push_back(CliGallery{arg, pending_name.value_or(std::string{})});
      pending_name.reset();
    }
  }
  if (pending_name) throw CliError("--name is not followed by a folder");
  return options;
}

auto CliUsage() -> std::string {
  return "Usage: imxup_cli [options] <folder> [--name <name>] [<folder> [--name <name>]...]\n"
         "\n"
         "Upload image folders as galleries and mirror them to the configured file hosts.\n"
         "\n"
         "Options:\n"
         "  --name <str>          gallery name of the preceding folder (default: folder name)\n"
         "  --thumb-size <1-6>    1=100x100 2=180x180 3=250x250 4=300x300 5=350x350 6=150x150\n"
         "  --content-type <0|1>  0=proportional thumbnails 1=square thumbnails\n"
         "  --config <file>       settings file (default: ~/.imxup/config.json)\n"
         "  --debug               verbose logging to stderr\n"
         "  --gui                 start the graphical interface\n"
         "  --version             print the version and exit\n"
         "  --help                print this help and exit\n";
}

auto ThumbnailFormatForContentType(int32_t content_type) -> int32_t {
  return content_type == 1 ? 3 : 2;
}

void ApplyCliOverrides(const CliOptions& options, AppConfig& config) {
  if (options.thumb_size_) config.primary_.thumbnail_size_ = *options.thumb_size_;
  if (options.content_type_) {
    config.primary_.thumbnail_format_ = ThumbnailFormatForContentType(*options.content_type_);
  }
}
};  // namespace imxup
