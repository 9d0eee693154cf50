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

#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "app/app_config.hpp"
#include "app/cli_options.hpp"
#include "app/upload_coordinator.hpp"
#include "auth/credential_cipher.hpp"
#include "network/curl_transport.hpp"

namespace {
std::atomic<bool> g_interrupted{false};

void OnSignal(int) { g_interrupted.store(true); }

auto RunUploads(const imxup::CliOptions& options) -> int {
  using namespace imxup;
  auto config_file =
      options.config_.empty() ? DefaultDataDir() / "config.json" : options.config_;
  auto cipher = CredentialCipher::ForCurrentUser();
  auto config = LoadAppConfig(config_file, cipher);
  ApplyCliOverrides(options, config);

  UploadCoordinator coordinator(config, cipher,
                                []() -> std::unique_ptr<HttpTransport> {
                                  return std::make_unique<CurlTransport>();
                                });
  coordinator.Start();
  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);

  bool                      failed = false;
  std::vector<gallery_id_t> ids;
  for (const auto& gallery : options.galleries_) {
    if (!std::filesystem::is_directory(gallery.path_)) {
      LOG(ERROR) << "[cli] not a folder: " << gallery.path_.string();
      failed = true;
      continue;
    }
    auto id = coordinator.AddGallery(gallery.path_, gallery.name_);
    if (!id) {
      LOG(WARNING) << "[cli] " << gallery.path_.string() << " is already in the queue";
      continue;
    }
    ids.push_back(*id);
  }

  bool idle = coordinator.WaitUntilIdle(std::chrono::hours{24 * 7},
                                        [] { return g_interrupted.load(); });
  if (!idle) LOG(WARNING) << "[cli] interrupted, running uploads are paused";
  coordinator.Stop();

  for (auto id : ids) {
    auto gallery = coordinator.Queue().Get(id);
    if (!gallery) continue;
    std::cout << std::format("{}: {} ({}/{} images)", gallery->name_, ToString(gallery->state_),
                             gallery->uploaded_images_, gallery->total_images_);
    if (!gallery->gallery_url_.empty()) std::cout << " " << gallery->gallery_url_;
    if (!gallery->error_message_.empty()) std::cout << " - " << gallery->error_message_;
    std::cout << "\n";
    if (gallery->state_ != GalleryState::COMPLETED) failed = true;
  }
  return failed ? kExitFailure : kExitOk;
}
}  // namespace

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  imxup::CliOptions options;
  try {
    options = imxup::ParseCliArgs(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const imxup::CliError& e) {
    std::cerr << e.what() << "\n\n" << imxup::CliUsage();
    return imxup::kExitUsage;
  }

  if (options.help_) {
    std::cout << imxup::CliUsage();
    return imxup::kExitOk;
  }
  if (options.version_) {
    std::cout << "imxup " << imxup::kImxupVersion << "\n";
    return imxup::kExitOk;
  }
  if (options.gui_) {
    std::cerr << "The graphical interface is provided separately; imxup_cli runs headless.\n";
    return imxup::kExitUsage;
  }
  if (options.debug_) FLAGS_v = 1;
  if (options.galleries_.empty()) {
    std::cerr << imxup::CliUsage();
    return imxup::kExitUsage;
  }

  try {
    return RunUploads(options);
  } catch (const std::exception& e) {
    LOG(ERROR) << "[cli] " << e.what();
    return imxup::kExitFailure;
  }
}
