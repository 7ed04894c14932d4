#pragma once

#include <cstddef>
#include <string>

namespace gdfs::fs::buffer {

enum class Strategy { None, Simple, Async, BoundedQueue };

struct Options {
    Strategy strategy = Strategy::Simple;
    size_t size_bytes = 1024 * 1024;
    unsigned int queue_depth = 8;
};

std::string to_string(Strategy strategy);
Strategy strategyFromString(const std::string& str);

}
