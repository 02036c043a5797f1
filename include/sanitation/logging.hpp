#pragma once

#ifdef SANITATION_ENABLE_LOGGING

#include <cstdint>
#include <iomanip>
#include <iostream>

#define SANITATION_LOG_REJECT(OFFSET, BYTE)                                             \
    ([](auto&& offset, auto&& b) {                                                      \
        auto fmt = std::ios(nullptr);                                                   \
        fmt.copyfmt(std::clog);                                                         \
        std::clog << "[sanitation] REJECT @" << offset << " 0x";                        \
        std::clog << std::hex << std::setfill('0') << std::setw(2) << std::uint32_t(b); \
        std::clog << std::endl;                                                         \
        std::clog.copyfmt(fmt);                                                         \
    }((OFFSET), (BYTE)))

#define SANITATION_LOG_PARTITION(NOTE, SAFE, GARBAGE)                                                      \
    ([](auto&& note, auto&& safe, auto&& garbage) {                                                        \
        std::clog << "[sanitation] PARTITION (" << note << ") safe:" << safe << " garbage:" << garbage << std::endl; \
    }((NOTE), (SAFE), (GARBAGE)))

#define SANITATION_LOG_BYTES(NOTE, DATA, COUNT)                                                       \
    ([](auto&& note, auto&& data, auto&& count) {                                                     \
        auto fmt = std::ios(nullptr);                                                                 \
        fmt.copyfmt(std::clog);                                                                       \
        std::clog << "[sanitation] BYTES (" << note << ") [";                                         \
        std::clog << std::hex << std::setfill('0');                                                   \
        for (auto i = std::size_t(0); i < std::size_t(count); ++i) {                                  \
            std::clog << std::setw(2) << std::uint32_t(std::uint8_t(data[i]));                        \
            if (i != std::size_t(count) - 1) {                                                        \
                std::clog << ",";                                                                     \
            }                                                                                         \
        }                                                                                             \
        std::clog << "]" << std::endl;                                                                \
        std::clog.copyfmt(fmt);                                                                       \
    }((NOTE), (DATA), (COUNT)))

#else
#define SANITATION_LOG_REJECT(OFFSET, BYTE) ((void)0)
#define SANITATION_LOG_PARTITION(NOTE, SAFE, GARBAGE) ((void)0)
#define SANITATION_LOG_BYTES(NOTE, DATA, COUNT) ((void)0)
#endif
