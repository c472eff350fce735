#pragma once
#include <string>
#include <random>
#include <sstream>

namespace maestro::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "wf-1a2b3c4d"
    inline std::string generate_run_id(const std::string& prefix = "wf-") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace maestro::core::config
