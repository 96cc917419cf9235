#include "language_router.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace coderun {
namespace router {

LanguageRouter::LanguageRouter(std::vector<execution::ProviderDescriptor> providers,
                               const std::map<std::string, std::string> &extra_aliases)
    : providers_(std::move(providers)), aliases_(builtin_aliases()) {
    // stable_sort keeps registration order between equal priorities
    std::stable_sort(providers_.begin(), providers_.end(),
                     [](const execution::ProviderDescriptor &a, const execution::ProviderDescriptor &b) {
                         return a.priority < b.priority;
                     });

    for (const auto &[alias, canonical] : extra_aliases) {
        auto key = normalize(alias);
        auto target = normalize(canonical);
        if (key.empty() || target.empty()) {
            continue;
        }
        aliases_[key] = target;
    }
}

std::string LanguageRouter::normalize(const std::string &raw_language) {
    size_t begin = 0;
    size_t end = raw_language.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw_language[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(raw_language[end - 1]))) {
        --end;
    }

    std::string out = raw_language.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::map<std::string, std::string> LanguageRouter::builtin_aliases() {
    return {
        {"py", "python"},         {"python3", "python"}, {"js", "javascript"}, {"node", "javascript"},
        {"nodejs", "javascript"}, {"ts", "typescript"},  {"sh", "bash"},       {"shell", "bash"},
        {"golang", "go"},         {"rs", "rust"},        {"rb", "ruby"},       {"cs", "csharp"},
        {"c#", "csharp"},
    };
}

std::string LanguageRouter::canonicalize(const std::string &raw_language) const {
    auto name = normalize(raw_language);
    auto it = aliases_.find(name);
    if (it != aliases_.end()) {
        return it->second;
    }
    return name;
}

bool LanguageRouter::resolve(const std::string &raw_language, Resolution &out, std::string &error) const {
    auto canonical = canonicalize(raw_language);
    if (canonical.empty()) {
        error = "Language not specified";
        return false;
    }

    Resolution resolution;
    resolution.canonical_language = canonical;
    for (const auto &descriptor : providers_) {
        if (descriptor.supports(canonical)) {
            resolution.candidates.push_back(descriptor);
        }
    }

    if (resolution.candidates.empty()) {
        error = "Unsupported language: '" + raw_language + "'";
        return false;
    }

    out = std::move(resolution);
    return true;
}

std::vector<std::string> LanguageRouter::supported_languages() const {
    std::set<std::string> languages;
    for (const auto &descriptor : providers_) {
        languages.insert(descriptor.supported_languages.begin(), descriptor.supported_languages.end());
    }
    return {languages.begin(), languages.end()};
}

}  // namespace router
}  // namespace coderun
