#include "app/language_selector.hpp"

#include <stdexcept>
#include <utility>

// Constructor
LanguageSelector::LanguageSelector(std::vector<Language> languages) : languages_(std::move(languages)) {
    if (languages_.empty()) throw std::invalid_argument("language list is empty");
}

const Language& LanguageSelector::current() const {
    return languages_[index_.load()];
}

// Moves to the next language, wrapping after the last one
const Language& LanguageSelector::advance() {
    std::size_t current = index_.load();
    std::size_t next = (current + 1) % languages_.size();
    while (!index_.compare_exchange_weak(current, next)) {
        next = (current + 1) % languages_.size();
    }
    return languages_[next];
}
