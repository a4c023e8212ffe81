#ifndef LANGUAGE_SELECTOR_HPP
#define LANGUAGE_SELECTOR_HPP

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

struct Language {
    std::string displayName;
    std::string code;           // passed to the transcription model
    std::string abbreviation;   // shown by the indicator
};

// Fixed, ordered language list with a circular cursor.
class LanguageSelector {
public:
    // Throws std::invalid_argument if languages is empty.
    explicit LanguageSelector(std::vector<Language> languages);

    const Language& current() const;
    const Language& advance();

    std::size_t index() const { return index_.load(); }
    std::size_t size() const { return languages_.size(); }

private:
    const std::vector<Language> languages_;
    std::atomic<std::size_t> index_{0};
};

#endif
