#include <macsweep/mac.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

TEST(MacMatcher, NormalizeStripsSeparatorsAndLowercases) {
    EXPECT_EQ(normalize_mac("28:CD:C1:AA:BB:CC"), "28cdc1aabbcc");
    EXPECT_EQ(normalize_mac("28-cd-c1"), "28cdc1");
    EXPECT_EQ(normalize_mac("28.cd.c1 zz"), "28cdc1");
    EXPECT_EQ(normalize_mac(""), "");
}

TEST(MacMatcher, MatchIgnoresSeparatorStyle) {
    const char* macs[] = {"28:cd:c1:aa:bb:cc", "28-CD-C1-AA-BB-CC", "28cdc1aabbcc"};
    const char* prefixes[] = {"28:cd:c1", "28-cd-c1", "28CDC1"};
    for (auto mac : macs) {
        for (auto prefix : prefixes) {
            EXPECT_TRUE(mac_matches(mac, prefix)) << mac << " / " << prefix;
        }
    }
    EXPECT_FALSE(mac_matches("28:cd:c2:aa:bb:cc", "28:cd:c1"));
}

TEST(MacMatcher, PartialNibblePrefix) {
    EXPECT_TRUE(mac_matches("f0:40:af:91:22:33", "f0:40:af:9"));
    EXPECT_FALSE(mac_matches("f0:40:af:81:22:33", "f0:40:af:9"));
}

TEST(MacMatcher, PrefixLongerThanMacNeverMatches) {
    EXPECT_FALSE(mac_matches("28:cd", "28:cd:c1"));
    EXPECT_FALSE(mac_matches("not a mac", "28:cd:c1"));
}

TEST(MacMatcher, FirstRuleWins) {
    MacMatcher matcher{{
        {"28:cd", "Broad"},
        {"28:cd:c1", "Narrow"},
    }};
    auto label = matcher.classify("28:cd:c1:aa:bb:cc");
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, "Broad");
}

TEST(MacMatcher, NoMatch) {
    MacMatcher matcher{default_rules()};
    EXPECT_FALSE(matcher.classify("00:11:22:33:44:55").has_value());
    EXPECT_FALSE(matcher.classify("").has_value());
}

TEST(MacMatcher, DefaultRules) {
    MacMatcher matcher{default_rules()};
    EXPECT_EQ(matcher.classify("94:83:c4:01:02:03").value_or(""), "GL Technologies");
    EXPECT_EQ(matcher.classify("dc:a6:32:01:02:03").value_or(""), "RaspberryPi");
    EXPECT_EQ(matcher.classify("8c:1f:64:34:a1:02").value_or(""), "RaspberryPi");
    EXPECT_FALSE(matcher.classify("8c:1f:64:34:b1:02").has_value());
}

TEST(MacMatcher, MatchKeepsRecordOrder) {
    MacMatcher matcher{{
        {"dc:a6:32", "RaspberryPi"},
        {"94:83:c4", "GL Technologies"},
    }};
    std::vector<NeighborRecord> records = {
        {IPv4{192, 168, 1, 1}, "94:83:c4:00:00:01"},
        {IPv4{192, 168, 1, 2}, "00:11:22:33:44:55"},
        {IPv4{192, 168, 1, 3}, "dc:a6:32:00:00:03"},
    };
    auto matches = matcher.match(records);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].label, "GL Technologies");
    EXPECT_EQ(matches[0].ip, (IPv4{192, 168, 1, 1}));
    EXPECT_EQ(matches[1].label, "RaspberryPi");
    EXPECT_EQ(matches[1].mac, "dc:a6:32:00:00:03");
}

TEST(MacMatcher, RejectsInvalidRules) {
    EXPECT_THROW(validate_rule(DevicePrefixRule{"::", "Empty"}), std::invalid_argument);
    EXPECT_THROW(validate_rule(DevicePrefixRule{"28:cd:c1:aa:bb:cc:dd", "TooLong"}), std::invalid_argument);
    EXPECT_THROW(validate_rule(DevicePrefixRule{"28:cd:c1", ""}), std::invalid_argument);
    EXPECT_THROW(validate_rule(DevicePrefixRule{"2", "OneNibble"}), std::invalid_argument);
    EXPECT_THROW(validate_rule(DevicePrefixRule{"28c", "ThreeNibbles"}), std::invalid_argument);
    EXPECT_NO_THROW(validate_rule(DevicePrefixRule{"28:cd", "FourNibbles"}));
    EXPECT_NO_THROW(validate_rule(DevicePrefixRule{"f0:40:af:9", "SevenNibbles"}));
    EXPECT_NO_THROW(validate_rule(DevicePrefixRule{"0a:bc:de:f0:12:34", "Test"}));

    std::vector<DevicePrefixRule> rules = default_rules();
    rules.push_back(DevicePrefixRule{"-", "Broken"});
    EXPECT_THROW(MacMatcher{rules}, std::invalid_argument);
}
