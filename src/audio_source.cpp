#include "audio_source.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {
    std::string lowercase(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    bool parseIndex(const std::string& str, int& index) {
        if (str.empty()) {
            return false;
        }
        size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
        if (start == str.size()) {
            return false;
        }
        for (size_t i = start; i < str.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
                return false;
            }
        }
        try {
            index = std::stoi(str);
        } catch (const std::out_of_range&) {
            return false;
        }
        return true;
    }
}

int resolveInputDevice(const std::string& device_selector,
                       const std::vector<InputDeviceInfo>& devices) {
    if (device_selector.empty()) {
        return -1;
    }

    int index = 0;
    if (parseIndex(device_selector, index)) {
        return index;
    }

    std::string needle = lowercase(device_selector);
    for (const auto& device : devices) {
        if (device.max_input_channels > 0 &&
            lowercase(device.name).find(needle) != std::string::npos) {
            return device.index;
        }
    }

    throw DeviceError("No audio device found matching '" + device_selector +
                      "'. Use --list_devices to see available devices");
}
