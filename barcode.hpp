/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <ZXing/BarcodeFormat.h>
#include <ZXing/BitMatrix.h>

#include <optional>
#include <string>
#include <string_view>

// Maps editor names such as "qr-code" or "ean-13" to a symbology, ignoring case.
std::optional<ZXing::BarcodeFormat> barcode_format(std::string_view barcode_type);

bool is_linear_barcode(ZXing::BarcodeFormat format);

// "low", "medium", "quartile" or "high" on the writer's 0 to 8 scale.
int barcode_ecc_level(std::string_view level);

// Encodes without a margin at the smallest module size. Throws if the
// value can not be expressed in the symbology.
ZXing::BitMatrix encode_barcode(const std::string &value, ZXing::BarcodeFormat format, std::string_view level);
