#pragma once

#include <chrono>
#include <cstddef>

constexpr static const char* upload_path = "upload";
constexpr static const char* chunked_download_prefix = "download-chunked";
constexpr static const char* upload_field_name = "file";

constexpr static std::size_t content_block_size = 1024;
constexpr static std::size_t stream_chunk_size = 64 * 1024;

constexpr static std::chrono::milliseconds default_request_timeout(60000);

constexpr static const char* content_alphabet
    = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr static std::size_t content_alphabet_size = 62;

#ifndef BUILD_OS_VERSION
#define BUILD_OS_VERSION "unknown"
#endif
#ifndef BUILD_COMPILER_VERSION
#define BUILD_COMPILER_VERSION "unknown"
#endif
