#include "utils.hpp"

#include <string>

using namespace std;

string Version::toString() const {
    return to_string(major) + "." + to_string(minor) + "." + to_string(patch);
}
