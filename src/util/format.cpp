#include <sstream>
#include <stdio.h>
#include <time.h>
#include <iomanip>

#include "util/format.hpp"

std::string formatBytes(double bytes) {
    const double KB = 1024.0;
    const double MB = KB * 1024.0;
    const double GB = MB * 1024.0;

    std::ostringstream oss;
    oss << std::fixed;

    if (bytes < KB) {
        oss << std::setprecision(0) << bytes << " B";
    } else if (bytes < MB) {
        oss << std::setprecision(0) << (bytes / KB) << " KB";
    } else if (bytes < GB) {
        oss << std::setprecision(1) << (bytes / MB) << " MB";
    } else {
        oss << std::setprecision(2) << (bytes / GB) << " GB";
    }

    return oss.str();
}

std::string formatSpeed(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0) {
        return "N/A";
    }
    return formatBytes(bytesPerSecond) + "/s";
}

std::string formatPercent(double percentage) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percentage << "%";
    return oss.str();
}

// Seconds as "1h 2m 3s", "2m 3s" or "3s"; non-positive durations are unknown
std::string formatDuration(double seconds) {
    if (seconds <= 0.0) {
        return "Unknown";
    }

    long total = static_cast<long>(seconds);
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m " << secs << "s";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

std::string formatTime(time_t time) {
    char buffer[20];
    struct tm *timeinfo = localtime(&time);
    strftime(buffer, sizeof(buffer), "%H:%M:%S %d/%m/%y", timeinfo);

    return std::string(buffer);
}
