#pragma once
#include <random>
#include <sstream>
#include <string>

namespace callplan::core::config {

    // Generates an 8-character hex ID prefixed with "batch-"
    inline std::string generate_batch_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "batch-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace callplan::core::config
