/**
 * @file units.cpp
 * @brief Implementation of unit conversion utilities.
 *
 * Conversion between byte counts and their human-readable form (1024-based
 * units), used for the --block-size option and in log messages.
 */

#include "units.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <vector>

/**
 * @brief Converts bytes to human-readable string with appropriate unit.
 *
 * Automatically selects the most appropriate unit (bytes, Kb, Mb, Gb, Tb)
 * based on the size, ensuring the numeric value is less than 4096.
 *
 * @param size Size in bytes.
 * @param default_unit Unit suffix to use for raw bytes (e.g., " bytes", "").
 * @param min_unit Minimum unit divisor (1 for bytes, 1024 for KB, etc.).
 * @return Human-readable size string (e.g., "15Mb", "2048 bytes").
 */
std::string bytes2human(uint64_t size, const char* default_unit, uint64_t min_unit){
    static const std::vector<std::string> units { "", "Kb", "Mb", "Gb", "Tb" };

    size_t i = 0;
    while( min_unit > 1 ){
        min_unit /= 1024;
        size /= 1024;
        i++;
    }
    while( i<units.size()-1 && size >= 4096 ){
        i++;
        size /= 1024;
    }
    return std::to_string(size) + (i == 0 ? default_unit : units[i]);
}

/**
 * @brief Converts human-readable size string to bytes.
 *
 * Parses strings like "15Mb", "2GB", "0x1000", "4096" and converts them
 * to byte values. Supports KB/MB/GB/TB units (case-insensitive) and
 * hexadecimal notation (0x prefix).
 *
 * @param size Human-readable size string.
 * @return Size in bytes.
 * @throws std::invalid_argument If the string is not a number or the unit is unsupported.
 * @throws std::out_of_range If the value overflows.
 */
uint64_t human2bytes(const std::string& size) {
    static const std::map<std::string, uint64_t> units = {
        {"kb", 1024},
        {"mb", 1024 * 1024},
        {"gb", 1024 * 1024 * 1024},
        {"tb", 1024ULL * 1024 * 1024 * 1024}
    };

    // if size starts with "0x" then it's a hex number
    if (size.length() > 2 && size[0] == '0' && (size[1]|0x20) == 'x') {
        size_t pos = 0;
        uint64_t result = std::stoull(size, &pos, 16);
        if (pos != size.length()) {
            throw std::invalid_argument("Invalid hex size: " + size);
        }
        return result;
    }

    size_t i = 0;
    for (; i < size.length(); ++i) {
        if (!isdigit(size[i])) {
            break;
        }
    }

    if (i == 0) {
        throw std::invalid_argument("Invalid size: \"" + size + "\"");
    }

    std::string numberPart = size.substr(0, i);
    std::string unitPart = i < size.length() ? size.substr(i) : "";
    std::transform(unitPart.begin(), unitPart.end(), unitPart.begin(), ::tolower);

    uint64_t number = std::stoull(numberPart);

    if( unitPart.size() == 1 )
        unitPart += 'b';

    if (!unitPart.empty() && units.find(unitPart) == units.end()) {
        throw std::invalid_argument("Unsupported unit: " + unitPart);
    }

    uint64_t multiplier = unitPart.empty() ? 1 : units.at(unitPart);
    uint64_t result = number * multiplier;

    // Simple overflow check, not comprehensive
    if (multiplier != 1 && result / multiplier != number) {
        throw std::out_of_range("Resulting value out of range: " + size);
    }

    return result;
}
