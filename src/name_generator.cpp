#include "hierophant/name_generator.hpp"
#include "hierophant/errors.hpp"
#include "hierophant/log.hpp"
#include "hierophant/seeded_random.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace hierophant {

namespace {

const std::array<std::string_view, 30> kPrefixes = {
    "Ald", "Bal", "Cor", "Dun", "Eld", "Fal", "Gar", "Hil", "Kal", "Lor",
    "Mor", "Nor", "Ost", "Pel", "Quen", "Rav", "Sil", "Thal", "Val", "Wel",
    "Wyn", "Xer", "Yor", "Zar", "Bran", "Crim", "Drak", "Eber", "Frey", "Glen",
};

const std::array<std::string_view, 30> kMiddles = {
    "dor", "mar", "wen", "thor", "var", "len", "dan", "kel", "rin", "mor",
    "wyn", "dal", "gar", "ven", "ton", "burg", "ham", "shire", "dale", "wood",
    "mer", "son", "ter", "den", "ford", "mont", "vale", "ridge", "stone", "haven",
};

const std::array<std::string_view, 20> kSuffixes = {
    "ia", "or", "en", "ar", "on", "us", "um", "land", "mark", "reich",
    "dom", "hold", "stead", "ton", "field", "mere", "moor", "crest", "peak", "watch",
};

template<size_t N>
std::string_view pick(const std::array<std::string_view, N>& table, SeededRandom& rng) {
    auto index = static_cast<size_t>(std::floor(rng.next() * static_cast<double>(N)));
    return table[std::min(index, N - 1)];
}

}  // namespace

const std::array<std::string_view, 30>& namePrefixes() { return kPrefixes; }
const std::array<std::string_view, 30>& nameMiddles() { return kMiddles; }
const std::array<std::string_view, 20>& nameSuffixes() { return kSuffixes; }

std::string generateName(int64_t seed) {
    SeededRandom rng(seed);

    const double structure = rng.next();
    const std::string_view prefix = pick(kPrefixes, rng);
    const std::string_view middle = pick(kMiddles, rng);
    const std::string_view suffix = pick(kSuffixes, rng);

    std::string name(prefix);
    if (structure < 0.6) {
        name.append(middle).append(suffix);
    } else if (structure < 0.9) {
        name.append(suffix);
    } else {
        name.append(middle);
    }
    return name;
}

size_t defaultNameAttempts(size_t count) {
    return std::max<size_t>(count * 64, 1024);
}

std::vector<std::string> generateUniqueNames(size_t count, int64_t baseSeed, size_t maxAttempts) {
    if (maxAttempts == 0) {
        maxAttempts = defaultNameAttempts(count);
    }

    std::vector<std::string> names;
    names.reserve(count);
    std::unordered_set<std::string> seen;

    int64_t seed = SeededRandom::reduceSeed(baseSeed);
    size_t attempts = 0;
    while (names.size() < count) {
        if (attempts >= maxAttempts) {
            std::string message = "generated " + std::to_string(names.size()) + " of " +
                                  std::to_string(count) + " unique names in " +
                                  std::to_string(attempts) + " attempts";
            Logger("NameGenerator").error(message);
            throw NameExhaustionError(message, count, names.size());
        }

        std::string name = generateName(seed);
        if (seen.insert(name).second) {
            names.push_back(std::move(name));
        }
        seed = (seed + 1) % SeededRandom::kModulus;
        ++attempts;
    }
    return names;
}

}  // namespace hierophant
