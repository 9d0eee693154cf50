//  Copyright 2025 Yurun Zi
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

#include <string>
#include <string_view>
#include <vector>

namespace conv {
/**
 * @brief Replace every invalid UTF-8 sequence with U+FFFD
 */
auto ToValidUtf8(std::string_view str) -> std::string;

auto ToLowerAscii(std::string_view str) -> std::string;
auto Trim(std::string_view str) -> std::string;
auto ReplaceAll(std::string str, std::string_view from, std::string_view to) -> std::string;
auto Contains(std::string_view haystack, std::string_view needle) -> bool;
auto ContainsNoCase(std::string_view haystack, std::string_view needle) -> bool;

/**
 * @brief Human ordering: digit runs compare by value, text compares case-insensitively.
 *        "img2.jpg" < "img10.jpg".
 */
auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool;
void NaturalSort(std::vector<std::string>& names);

/**
 * @brief Strip characters the primary host rejects in gallery names. Keeps ASCII letters,
 *        digits, ",.-_()" and whitespace, collapses whitespace runs into one space and trims.
 */
auto SanitizeGalleryName(std::string_view name) -> std::string;

auto UrlEncode(std::string_view str) -> std::string;
};  // namespace conv
