#pragma once
#include <cstdint>
#include <string>

// 3145728 => "3072Kb", 4194304 => "4Mb"
std::string bytes2human(uint64_t size, const char* default_unit = "", uint64_t min_unit = 1);

// "4096", "0x1000", "4k", "4Kb" => 4096
// throws std::invalid_argument on malformed input, std::out_of_range on overflow
uint64_t human2bytes(const std::string& size);
