#include <gtest/gtest.h>

#include "features.hpp"

namespace kir {
namespace {

TEST(LanguageFeaturesTest, SuspendConversionIsOnByDefault) {
    EXPECT_TRUE(LanguageFeatures{}.suspend_conversion);
}

TEST(LanguageFeaturesTest, FlagsToggleSuspendConversion) {
    LanguageFeatures f{};
    EXPECT_TRUE(apply_language_flag(f, "-XXLanguage:-SuspendConversion"));
    EXPECT_FALSE(f.suspend_conversion);
    EXPECT_TRUE(apply_language_flag(f, "-XXLanguage:+SuspendConversion"));
    EXPECT_TRUE(f.suspend_conversion);
}

TEST(LanguageFeaturesTest, RejectsMalformedAndUnknownFlags) {
    LanguageFeatures f{};
    EXPECT_FALSE(apply_language_flag(f, "-XXLanguage:SuspendConversion"));
    EXPECT_FALSE(apply_language_flag(f, "-XXLanguage:-InlineClasses"));
    EXPECT_FALSE(apply_language_flag(f, "-XXLanguage:"));
    EXPECT_FALSE(apply_language_flag(f, "-Xsuspend"));
    EXPECT_FALSE(apply_language_flag(f, ""));
    EXPECT_TRUE(f.suspend_conversion);
}

}  // namespace
}  // namespace kir
