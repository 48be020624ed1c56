#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <vector>

/**
 * @file CharMatrix.hpp
 * @brief Fixed-width character matrices used to store row labels.
 *
 * @details
 * Labels are stored row by row in a `(rows, width)` matrix; shorter labels are padded with
 * `'\0'`. `width` is the longest label length (at least 1).
 */

namespace seriesio::io
{

struct CharMatrix
{
    std::size_t rows = 0;
    std::size_t width = 0;
    std::vector<char> data; // rows * width, row-major
};

CharMatrix str2chars(const std::vector<std::string>& labels);

/// Inverse of str2chars; trailing '\0' padding is stripped from each row.
std::vector<std::string> chars2str(std::span<const char> data, std::size_t rows,
                                   std::size_t width);

} // namespace seriesio::io
