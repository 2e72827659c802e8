#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- growable byte buffer used to build on-disk records
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    [[nodiscard]] std::span<const uint8_t> view() const noexcept {
        return std::span<const uint8_t>(buf_.data(), buf_.size());
    }

    /// Move the internal buffer out, leaving the stream empty.
    [[nodiscard]] std::vector<uint8_t> release() {
        return std::move(buf_);
    }

    void reserve(size_t n) { buf_.reserve(n); }

private:
    std::vector<uint8_t> buf_;
};

// ---------------------------------------------------------------------------
// SpanReader -- read-only cursor over an existing byte span (zero-copy)
// ---------------------------------------------------------------------------
// Reads past the end throw std::out_of_range; decoders catch it and report
// a corrupt record.
class SpanReader {
public:
    explicit SpanReader(std::span<const uint8_t> data)
        : data_(data) {}

    void read(std::span<uint8_t> buf) {
        if (buf.size() > remaining()) {
            throw std::out_of_range(
                "SpanReader::read(): attempted read past end of span");
        }
        std::memcpy(buf.data(), data_.data() + pos_, buf.size());
        pos_ += buf.size();
    }

    /// Zero-copy view of the next @p n bytes.
    std::span<const uint8_t> take(size_t n) {
        if (n > remaining()) {
            throw std::out_of_range(
                "SpanReader::take(): attempted read past end of span");
        }
        auto out = data_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] bool eof() const noexcept { return pos_ >= data_.size(); }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}  // namespace core
