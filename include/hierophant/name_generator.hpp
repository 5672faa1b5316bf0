/**
 * @file name_generator.hpp
 * @brief Medieval-style territory names from syllable tables
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hierophant {

[[nodiscard]] const std::array<std::string_view, 30>& namePrefixes();
[[nodiscard]] const std::array<std::string_view, 30>& nameMiddles();
[[nodiscard]] const std::array<std::string_view, 20>& nameSuffixes();

/// Name for one seed.
///
/// Draws r, then a prefix, middle and suffix index. r < 0.6 gives
/// prefix+middle+suffix, r < 0.9 prefix+suffix, otherwise prefix+middle.
[[nodiscard]] std::string generateName(int64_t seed);

/// Default attempt ceiling for count names: max(64 * count, 1024)
[[nodiscard]] size_t defaultNameAttempts(size_t count);

/// count distinct names from seeds baseSeed, baseSeed + 1, ...
///
/// Names keep the order in which they were first produced.
/// @param maxAttempts Seeds to try before giving up (0 = defaultNameAttempts)
/// @throws NameExhaustionError when the ceiling is hit first
[[nodiscard]] std::vector<std::string> generateUniqueNames(size_t count, int64_t baseSeed,
                                                           size_t maxAttempts = 0);

}  // namespace hierophant
