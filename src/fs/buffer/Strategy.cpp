#include "fs/buffer/Strategy.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gdfs::fs::buffer {

std::string to_string(const Strategy strategy) {
    switch (strategy) {
        case Strategy::None: return "none";
        case Strategy::Simple: return "simple";
        case Strategy::Async: return "async";
        case Strategy::BoundedQueue: return "queue";
    }
    return "simple";
}

Strategy strategyFromString(const std::string& str) {
    std::string s = str;
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (s == "none") return Strategy::None;
    if (s == "simple") return Strategy::Simple;
    if (s == "async") return Strategy::Async;
    if (s == "queue" || s == "bounded_queue") return Strategy::BoundedQueue;
    throw std::invalid_argument("Unknown write buffer strategy: " + str);
}

}
