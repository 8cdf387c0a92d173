#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>

struct Version {
    int major;
    int minor;
    int patch;

    std::string toString() const;
};

inline constexpr Version PNGME_VERSION = Version{1, 0, 0};

#endif
