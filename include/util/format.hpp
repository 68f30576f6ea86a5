#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <string>
#include <ctime>

std::string formatBytes(double bytes);
std::string formatSpeed(double bytesPerSecond);
std::string formatPercent(double percentage);
std::string formatDuration(double seconds);
std::string formatTime(time_t time);

#endif
