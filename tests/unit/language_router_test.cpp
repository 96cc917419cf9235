#include "router/language_router.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace coderun;
using namespace testing;

namespace {

execution::ProviderDescriptor make_descriptor(const std::string &name, int priority,
                                              std::vector<std::string> languages) {
    execution::ProviderDescriptor descriptor;
    descriptor.name = name;
    descriptor.priority = priority;
    descriptor.supported_languages = std::move(languages);
    return descriptor;
}

std::vector<std::string> candidate_names(const router::Resolution &resolution) {
    std::vector<std::string> names;
    for (const auto &candidate : resolution.candidates) {
        names.push_back(candidate.name);
    }
    return names;
}

}  // namespace

class LanguageRouterTest : public Test {
protected:
    // Registration order: container first, but cloud has the better priority
    router::LanguageRouter language_router{{make_descriptor("container", 20, {"python", "javascript", "go", "rust"}),
                                   make_descriptor("cloud", 10, {"python", "javascript", "bash"})}};
};

TEST_F(LanguageRouterTest, ResolvesCanonicalLanguage) {
    router::Resolution resolution;
    std::string error;
    ASSERT_TRUE(language_router.resolve("python", resolution, error)) << error;

    EXPECT_EQ(resolution.canonical_language, "python");
    EXPECT_THAT(candidate_names(resolution), ElementsAre("cloud", "container"));
}

TEST_F(LanguageRouterTest, NormalizesCaseAndWhitespace) {
    router::Resolution resolution;
    std::string error;
    ASSERT_TRUE(language_router.resolve("  PyThOn \n", resolution, error)) << error;
    EXPECT_EQ(resolution.canonical_language, "python");
}

TEST_F(LanguageRouterTest, ResolvesBuiltinAliases) {
    router::Resolution resolution;
    std::string error;

    ASSERT_TRUE(language_router.resolve("py", resolution, error));
    EXPECT_EQ(resolution.canonical_language, "python");

    ASSERT_TRUE(language_router.resolve("Node", resolution, error));
    EXPECT_EQ(resolution.canonical_language, "javascript");

    ASSERT_TRUE(language_router.resolve("sh", resolution, error));
    EXPECT_EQ(resolution.canonical_language, "bash");
    EXPECT_THAT(candidate_names(resolution), ElementsAre("cloud"));

    ASSERT_TRUE(language_router.resolve("golang", resolution, error));
    EXPECT_EQ(resolution.canonical_language, "go");
    EXPECT_THAT(candidate_names(resolution), ElementsAre("container"));
}

TEST_F(LanguageRouterTest, UnsupportedLanguageFails) {
    router::Resolution resolution;
    std::string error;
    EXPECT_FALSE(language_router.resolve("cobol", resolution, error));
    EXPECT_THAT(error, HasSubstr("cobol"));
    EXPECT_TRUE(resolution.candidates.empty());
}

TEST_F(LanguageRouterTest, EmptyLanguageFails) {
    router::Resolution resolution;
    std::string error;
    EXPECT_FALSE(language_router.resolve("   ", resolution, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(LanguageRouterTest, KnownAliasWithoutProviderFails) {
    // "rb" maps to ruby, which nobody here declares
    router::Resolution resolution;
    std::string error;
    EXPECT_FALSE(language_router.resolve("rb", resolution, error));
    EXPECT_EQ(language_router.canonicalize("rb"), "ruby");
}

TEST_F(LanguageRouterTest, SupportedLanguagesAreSortedUnion) {
    EXPECT_THAT(language_router.supported_languages(), ElementsAre("bash", "go", "javascript", "python", "rust"));
}

TEST(LanguageRouterOrderTest, EqualPriorityKeepsRegistrationOrder) {
    router::LanguageRouter language_router({make_descriptor("b", 10, {"python"}), make_descriptor("a", 10, {"python"}),
                                   make_descriptor("c", 5, {"python"})});

    router::Resolution resolution;
    std::string error;
    ASSERT_TRUE(language_router.resolve("python", resolution, error));
    EXPECT_THAT(candidate_names(resolution), ElementsAre("c", "b", "a"));
}

TEST(LanguageRouterOrderTest, ConfiguredAliasesExtendAndOverride) {
    router::LanguageRouter language_router({make_descriptor("cloud", 10, {"python", "javascript"})},
                                  {{"Snake", "PYTHON"}, {"js", "python"}, {"", "python"}});

    EXPECT_EQ(language_router.canonicalize("snake"), "python");
    EXPECT_EQ(language_router.canonicalize("js"), "python");  // overrides the builtin
    EXPECT_EQ(language_router.aliases().count(""), 0u);
}

TEST(LanguageRouterOrderTest, NoProvidersMeansNothingResolves) {
    router::LanguageRouter language_router(std::vector<execution::ProviderDescriptor>{});
    router::Resolution resolution;
    std::string error;
    EXPECT_FALSE(language_router.resolve("python", resolution, error));
    EXPECT_TRUE(language_router.supported_languages().empty());
}
