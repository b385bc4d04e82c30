#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <string>

namespace board {

// Produces fresh opaque object ids. The default draws 12 characters from a
// URL-safe alphabet; tests inject a counter for deterministic ids.
class IdSource {
public:
    using Generator = std::function<std::string()>;

    IdSource();
    explicit IdSource(std::uint32_t seed);
    explicit IdSource(Generator generator);

    std::string next();

    // Deterministic "<prefix><n>" ids.
    static IdSource sequential(const std::string& prefix);

private:
    std::string randomId(std::size_t length);

    Generator generator_;
    std::mt19937 rng_;
};

} // namespace board
