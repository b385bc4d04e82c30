#include "board/core/id_source.h"

#include <memory>
#include <utility>

namespace board {

namespace {
    constexpr char kAlphabet[] = "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";
    constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;
    constexpr std::size_t kIdLength = 12;
}

IdSource::IdSource() : rng_(std::random_device{}()) {}

IdSource::IdSource(std::uint32_t seed) : rng_(seed) {}

IdSource::IdSource(Generator generator) : generator_(std::move(generator)), rng_(0u) {}

std::string IdSource::next() {
    if (generator_) return generator_();
    return randomId(kIdLength);
}

IdSource IdSource::sequential(const std::string& prefix) {
    auto counter = std::make_shared<std::uint64_t>(0);
    return IdSource(Generator([prefix, counter]() {
        ++(*counter);
        return prefix + std::to_string(*counter);
    }));
}

std::string IdSource::randomId(std::size_t length) {
    std::uniform_int_distribution<std::size_t> dist(0, kAlphabetSize - 1);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kAlphabet[dist(rng_)]);
    }
    return out;
}

} // namespace board
