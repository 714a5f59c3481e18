#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>

namespace kuf {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

constexpr f32 PI = 3.14159265358979323846f;
constexpr f32 TWO_PI = 2.0f * PI;
constexpr f32 INFINITE_RANGE = std::numeric_limits<f32>::infinity();

} // namespace kuf
