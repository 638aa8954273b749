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

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

void test_format_names() {
    CHECK(barcode_format("qr-code") == ZXing::BarcodeFormat::QRCode);
    CHECK(barcode_format("QR-Code") == ZXing::BarcodeFormat::QRCode);
    CHECK(barcode_format("ean-13") == ZXing::BarcodeFormat::EAN13);
    CHECK(barcode_format("code-128") == ZXing::BarcodeFormat::Code128);
    CHECK(barcode_format("pdf-417") == ZXing::BarcodeFormat::PDF417);
    CHECK(barcode_format("data-matrix") == ZXing::BarcodeFormat::DataMatrix);
    CHECK(!barcode_format("maxicode-ish"));
    CHECK(!barcode_format(""));

    CHECK(is_linear_barcode(ZXing::BarcodeFormat::EAN13));
    CHECK(is_linear_barcode(ZXing::BarcodeFormat::ITF));
    CHECK(!is_linear_barcode(ZXing::BarcodeFormat::Aztec));

    CHECK(barcode_ecc_level("low") == 2);
    CHECK(barcode_ecc_level("High") == 8);
    CHECK(barcode_ecc_level("whatever") == 4);
}

void test_encoding() {
    const auto qr = encode_barcode("hello", ZXing::BarcodeFormat::QRCode, "medium");
    CHECK(qr.width() == 21);
    CHECK(qr.height() == 21);
    // Finder pattern corner.
    CHECK(qr.get(0, 0));

    const auto ean = encode_barcode("5901234123457", ZXing::BarcodeFormat::EAN13, "medium");
    CHECK(ean.width() >= 95);
    CHECK(ean.height() >= 1);
    CHECK(ean.get(0, 0));

    bool threw = false;
    try {
        encode_barcode("not digits", ZXing::BarcodeFormat::EAN13, "medium");
    } catch(const std::exception &) {
        threw = true;
    }
    CHECK(threw);
}

int main(int, char **) {
    printf("Running barcode tests.\n");
    test_format_names();
    test_encoding();
    return 0;
}
