#include <sstream>
#include <iomanip>

#include "util/format.hpp"

std::string formatBytes(uint64_t bytes)
{
    const double KB = 1024.0;
    const double MB = KB * 1024.0;
    const double GB = MB * 1024.0;
    const double value = static_cast<double>(bytes);

    std::ostringstream oss;
    oss << std::fixed;

    if (value < KB)
    {
        oss << bytes << " B";
    }
    else if (value < MB)
    {
        oss << std::setprecision(0) << (value / KB) << " KB";
    }
    else if (value < GB)
    {
        oss << std::setprecision(1) << (value / MB) << " MB";
    }
    else
    {
        oss << std::setprecision(2) << (value / GB) << " GB";
    }

    return oss.str();
}

std::string formatProgress(uint64_t bytesRead, std::optional<uint64_t> size)
{
    return formatBytes(bytesRead) + " / " + (size ? formatBytes(*size) : std::string("?"));
}

std::optional<double> progressPercent(uint64_t bytesRead, std::optional<uint64_t> size)
{
    if (!size || *size == 0)
    {
        return std::nullopt;
    }

    const double percent = 100.0 * static_cast<double>(bytesRead) / static_cast<double>(*size);
    return percent > 100.0 ? 100.0 : percent;
}
