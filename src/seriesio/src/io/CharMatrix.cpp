#include "io/CharMatrix.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cstring>

namespace seriesio::io
{

CharMatrix str2chars(const std::vector<std::string>& labels)
{
    CharMatrix m;
    m.rows = labels.size();
    m.width = 1;
    for (const auto& s : labels)
        m.width = std::max(m.width, s.size());
    m.data.assign(m.rows * m.width, '\0');
    for (std::size_t r = 0; r < m.rows; ++r)
        std::memcpy(m.data.data() + r * m.width, labels[r].data(), labels[r].size());
    return m;
}

std::vector<std::string> chars2str(std::span<const char> data, std::size_t rows,
                                   std::size_t width)
{
    if (data.size() != rows * width)
        throw Error(ErrorKind::InvalidArgument,
                    "A character matrix of shape (" + std::to_string(rows) + ", " +
                        std::to_string(width) + ") requires " + std::to_string(rows * width) +
                        " characters, got " + std::to_string(data.size()) + ".");
    std::vector<std::string> out;
    out.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r)
    {
        const char* p = data.data() + r * width;
        const auto* end = std::find(p, p + width, '\0');
        out.emplace_back(p, end);
    }
    return out;
}

} // namespace seriesio::io
