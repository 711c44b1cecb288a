/*
 * stream_pump.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stream_pump.hpp"

namespace sandrun::isolated {

void BoundedBuffer::append(const char* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    std::uint64_t room = capacity_ > data_.size() ? capacity_ - data_.size() : 0;
    if (size > room) {
        truncated_ = true;
        size = static_cast<std::size_t>(room);
    }
    data_.append(data, size);
}

}  // namespace sandrun::isolated
