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

#include <cstdint>
#include <filesystem>
#include <string>

namespace imxup {

#define file_path_t     std::filesystem::path

// Row id of a gallery record in the queue store
#define gallery_id_t    int64_t

// Row id of a secondary host upload job
#define host_job_id_t   int64_t

// Row id of a single file of a gallery
#define gallery_file_id_t int64_t

// Identity of a configured secondary host ("rapidgator", "keep2share", ...)
#define host_id_t       std::string

// Unix seconds
#define unix_ts_t       int64_t

// Identity used in the worker status table
#define worker_id_t     std::string
};  // namespace imxup
