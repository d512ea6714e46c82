/*
 * guest_io.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "guest_io.hpp"

#include <cstdint>

namespace pyvault::runtime {

namespace {

constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at data[0], or 0 if invalid.
std::size_t validSequenceLength(const unsigned char* data, std::size_t size) {
    const unsigned char lead = data[0];
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    std::uint32_t minimum = 0;
    std::uint32_t codePoint = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        minimum = 0x80;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        minimum = 0x800;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        minimum = 0x10000;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }

    if (size < length) {
        return 0;
    }
    for (std::size_t i = 1; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            return 0;
        }
        codePoint = (codePoint << 6) | (data[i] & 0x3F);
    }

    // Overlong encodings, surrogates and out-of-range values
    if (codePoint < minimum || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        return 0;
    }
    return length;
}

}  // namespace

std::string decodeLossy(std::string_view bytes) {
    std::string decoded;
    decoded.reserve(bytes.size());

    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const auto length =
            validSequenceLength(data + offset, bytes.size() - offset);
        if (length == 0) {
            decoded.append(kReplacementCharacter);
            ++offset;
            continue;
        }
        decoded.append(bytes.substr(offset, length));
        offset += length;
    }
    return decoded;
}

// ============================================================================
// CapturedOutput
// ============================================================================

void CapturedOutput::write(std::string_view bytes) {
    std::lock_guard lock(mutex_);
    buffer_.append(bytes);
}

std::string CapturedOutput::toStringLossy() const {
    std::lock_guard lock(mutex_);
    return decodeLossy(buffer_);
}

std::string CapturedOutput::bytes() const {
    std::lock_guard lock(mutex_);
    return buffer_;
}

std::size_t CapturedOutput::size() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

void CapturedOutput::clear() {
    std::lock_guard lock(mutex_);
    buffer_.clear();
}

// ============================================================================
// ProvidedInput
// ============================================================================

std::string ProvidedInput::readRemaining() {
    std::lock_guard lock(mutex_);
    auto rest = data_.substr(position_);
    position_ = data_.size();
    return rest;
}

std::size_t ProvidedInput::remaining() const {
    std::lock_guard lock(mutex_);
    return data_.size() - position_;
}

}  // namespace pyvault::runtime
