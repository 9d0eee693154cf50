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

#pragma once

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "queue/gallery.hpp"
#include "queue/queue_manager.hpp"
#include "utils/queue/queue.hpp"

namespace imxup {
/**
 * @brief Sample dimensions of the first, one-third, two-thirds and last files. Files that cannot
 *        be read are skipped. Width and height are written back into the sampled entries.
 */
auto SampleDimensions(const file_path_t& folder, std::vector<GalleryFile>& files)
    -> ImageDimensions;

/**
 * @brief Single background worker that takes galleries from Validating to Ready
 */
class GalleryScanner {
 public:
  explicit GalleryScanner(QueueManager& queue);
  ~GalleryScanner();

  GalleryScanner(const GalleryScanner&)            = delete;
  GalleryScanner& operator=(const GalleryScanner&) = delete;

  void Start();
  void Stop();
  void Submit(gallery_id_t id);

  /**
   * @brief Validate and scan one gallery on the calling thread
   *
   * @return true when the gallery reached Ready (or Queued for auto-start galleries)
   */
  auto ScanNow(gallery_id_t id) -> bool;

 private:
  void Run();
  void RejectValidation(gallery_id_t id, const std::string& message);

  QueueManager&                         queue_;
  ConcurrentBlockingQueue<gallery_id_t> requests_;
  std::thread                           worker_;
  std::atomic<bool>                     running_{false};
};
};  // namespace imxup
