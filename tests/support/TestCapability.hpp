/**
 * @file tests/support/TestCapability.hpp
 * @brief Conversion capability whose behaviour a test scripts with a lambda.
 */
#pragma once

#include "capabilities/IConversionCapability.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <utility>

namespace cortex_test {

using CortexWorker::Capabilities::ConversionResult;
using CortexWorker::Capabilities::IConversionCapability;

class TestCapability : public IConversionCapability {
public:
    using Behaviour = std::function<ConversionResult(const std::filesystem::path&, int call)>;

    explicit TestCapability(Behaviour behaviour) : behaviour_(std::move(behaviour)) {}

    const char* name() const noexcept override { return "test"; }

    ConversionResult convert(const std::filesystem::path& input) const override {
        const int call = ++calls_;
        return behaviour_(input, call);
    }

    int calls() const { return calls_.load(); }

private:
    Behaviour behaviour_;
    mutable std::atomic<int> calls_{0};
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace cortex_test
