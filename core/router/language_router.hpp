#pragma once

#include <map>
#include <string>
#include <vector>

#include "execution/types.hpp"

namespace coderun {
namespace router {

struct Resolution {
    std::string canonical_language;
    std::vector<execution::ProviderDescriptor> candidates;  // default order: priority asc, then registration
};

// LanguageRouter - maps a caller-supplied language name to a canonical
// identifier and the providers able to run it. Immutable after construction,
// so it is safe to share across request threads without locking.
class LanguageRouter {
public:
    // providers must be in registration order
    explicit LanguageRouter(std::vector<execution::ProviderDescriptor> providers,
                            const std::map<std::string, std::string> &extra_aliases = {});

    // Returns false with error set when no provider declares the language
    bool resolve(const std::string &raw_language, Resolution &out, std::string &error) const;

    // Lower-cased, trimmed, alias-resolved name. Does not check provider support.
    std::string canonicalize(const std::string &raw_language) const;

    // Canonical languages some provider declares, sorted
    std::vector<std::string> supported_languages() const;

    const std::map<std::string, std::string> &aliases() const { return aliases_; }

    static std::string normalize(const std::string &raw_language);
    static std::map<std::string, std::string> builtin_aliases();

private:
    std::vector<execution::ProviderDescriptor> providers_;  // sorted by (priority, registration)
    std::map<std::string, std::string> aliases_;
};

}  // namespace router
}  // namespace coderun
