#pragma once

#include "Constants.h"
#include <string>

namespace NetLink {
    struct Version {
        static constexpr const char* STRING = "1.2.0";

        /// Release plus the wire revisions it speaks, for --version
        static std::string describe() {
            return std::string(STRING) + " (frames 0x" + hex(nlk::config::MAGIC_LEGACY_SINGLE) +
                   "-0x" + hex(nlk::config::MAGIC_RESUMABLE) + ", beacon v" +
                   std::to_string(nlk::config::BEACON_VERSION) + ")";
        }

    private:
        static std::string hex(uint32_t value) {
            static const char digits[] = "0123456789ABCDEF";
            std::string out(8, '0');
            for (int i = 7; i >= 0; --i, value >>= 4) {
                out[static_cast<size_t>(i)] = digits[value & 0xF];
            }
            return out;
        }
    };
}
