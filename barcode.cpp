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

#include <barcode.hpp>
#include <utils.hpp>

#include <ZXing/MultiFormatWriter.h>

#include <unordered_map>

namespace {

const std::unordered_map<std::string, ZXing::BarcodeFormat> formats{
    {"ean-13", ZXing::BarcodeFormat::EAN13},
    {"ean-8", ZXing::BarcodeFormat::EAN8},
    {"upc-a", ZXing::BarcodeFormat::UPCA},
    {"upc-e", ZXing::BarcodeFormat::UPCE},
    {"code-128", ZXing::BarcodeFormat::Code128},
    {"code-39", ZXing::BarcodeFormat::Code39},
    {"code-93", ZXing::BarcodeFormat::Code93},
    {"codabar", ZXing::BarcodeFormat::Codabar},
    {"itf", ZXing::BarcodeFormat::ITF},
    {"qr-code", ZXing::BarcodeFormat::QRCode},
    {"data-matrix", ZXing::BarcodeFormat::DataMatrix},
    {"aztec", ZXing::BarcodeFormat::Aztec},
    {"pdf-417", ZXing::BarcodeFormat::PDF417},
};

const std::unordered_map<std::string, int> ecc_levels{
    {"low", 2},
    {"l", 2},
    {"medium", 4},
    {"m", 4},
    {"quartile", 6},
    {"q", 6},
    {"high", 8},
    {"h", 8},
};

} // namespace

std::optional<ZXing::BarcodeFormat> barcode_format(std::string_view barcode_type) {
    auto it = formats.find(utf8_lower(trim(barcode_type)));
    if(it == formats.end()) {
        return {};
    }
    return it->second;
}

bool is_linear_barcode(ZXing::BarcodeFormat format) {
    switch(format) {
    case ZXing::BarcodeFormat::QRCode:
    case ZXing::BarcodeFormat::DataMatrix:
    case ZXing::BarcodeFormat::Aztec:
    case ZXing::BarcodeFormat::PDF417:
        return false;
    default:
        return true;
    }
}

int barcode_ecc_level(std::string_view level) {
    auto it = ecc_levels.find(utf8_lower(trim(level)));
    return it == ecc_levels.end() ? 4 : it->second;
}

ZXing::BitMatrix encode_barcode(const std::string &value, ZXing::BarcodeFormat format, std::string_view level) {
    ZXing::MultiFormatWriter writer(format);
    writer.setMargin(0);
    if(!is_linear_barcode(format)) {
        writer.setEccLevel(barcode_ecc_level(level));
    }
    return writer.encode(value, 0, 0);
}
