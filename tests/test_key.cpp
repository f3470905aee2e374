/**
 * test_key.cpp - Tests for key text forms and the binding table
 */

#include <gtest/gtest.h>
#include <sqlnav/ui/key_config.hpp>

#include <set>
#include <string>

using namespace sqlnav::ui;

TEST(KeyTest, FormatKeys) {
    EXPECT_EQ(format_key(Key::chr('j')), "j");
    EXPECT_EQ(format_key(Key::chr(' ')), "Space");
    EXPECT_EQ(format_key(Key::control('d')), "Ctrl-d");
    EXPECT_EQ(format_key(Key::meta('x')), "Alt-x");
    EXPECT_EQ(format_key(Key::of(KeyCode::PageDown)), "PageDown");
    EXPECT_EQ(format_key(Key::function(5)), "F5");
    EXPECT_EQ(format_key(Key::chr(0xE9)), "\xC3\xA9");
}

TEST(KeyTest, ParseKeys) {
    EXPECT_EQ(parse_key("j"), Key::chr('j'));
    EXPECT_EQ(parse_key("G"), Key::chr('G'));
    EXPECT_EQ(parse_key("Ctrl-d"), Key::control('d'));
    EXPECT_EQ(parse_key("Ctrl-D"), Key::control('d'));
    EXPECT_EQ(parse_key("Alt-x"), Key::meta('x'));
    EXPECT_EQ(parse_key("Space"), Key::chr(' '));
    EXPECT_EQ(parse_key("Enter"), Key::of(KeyCode::Enter));
    EXPECT_EQ(parse_key("F12"), Key::function(12));
    EXPECT_EQ(parse_key("\xC3\xA9"), Key::chr(0xE9));
}

TEST(KeyTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_key("").has_value());
    EXPECT_FALSE(parse_key("Ctrl-").has_value());
    EXPECT_FALSE(parse_key("jj").has_value());
    EXPECT_FALSE(parse_key("F0").has_value());
    EXPECT_FALSE(parse_key("F25").has_value());
    EXPECT_FALSE(parse_key("Hyper-x").has_value());
}

TEST(KeyTest, FormatParseAgree) {
    for (const Key& k : {Key::control('u'), Key::of(KeyCode::Esc), Key::chr('/'), Key::function(1)}) {
        EXPECT_EQ(parse_key(format_key(k)), k) << format_key(k);
    }
}

TEST(KeyTest, TextKeys) {
    EXPECT_TRUE(Key::chr('a').is_text());
    EXPECT_TRUE(Key::chr(' ').is_text());
    EXPECT_FALSE(Key::control('a').is_text());
    EXPECT_FALSE(Key::meta('a').is_text());
    EXPECT_FALSE(Key::of(KeyCode::Enter).is_text());
}

TEST(KeyConfigTest, ActionNamesRoundTrip) {
    for (const auto& info : action_table()) {
        auto parsed = parse_action(info.name);
        ASSERT_TRUE(parsed.has_value()) << info.name;
        EXPECT_EQ(*parsed, info.action);
        EXPECT_STREQ(action_name(info.action), info.name);
    }
    EXPECT_FALSE(parse_action("fly_away").has_value());
}

TEST(KeyConfigTest, TableOrderMatchesEnum) {
    for (size_t i = 0; i < action_count; ++i) {
        EXPECT_EQ(static_cast<size_t>(action_table()[i].action), i);
    }
}

TEST(KeyConfigTest, Defaults) {
    KeyConfig keys;
    EXPECT_TRUE(keys.matches(Action::ScrollDown, Key::chr('j')));
    EXPECT_TRUE(keys.matches(Action::ScrollDownMultiline, Key::control('d')));
    EXPECT_TRUE(keys.matches(Action::ScrollToBottom, Key::chr('G')));
    EXPECT_TRUE(keys.matches(Action::ExtendSelectionDown, Key::chr('J')));
    EXPECT_TRUE(keys.matches(Action::Quit, Key::chr('q')));
    EXPECT_TRUE(keys.matches(Action::TabIndexes, Key::chr('5')));
    EXPECT_TRUE(keys.down(Key::of(KeyCode::Down)));
    EXPECT_TRUE(keys.up(Key::chr('k')));
    EXPECT_FALSE(keys.up(Key::chr('j')));
}

TEST(KeyConfigTest, DefaultsAreDistinct) {
    KeyConfig keys;
    std::set<std::string> seen;
    for (const auto& info : action_table()) {
        EXPECT_TRUE(seen.insert(format_key(keys.key(info.action))).second) << info.name;
    }
}

TEST(KeyConfigTest, Rebind) {
    KeyConfig keys;
    keys.bind(Action::ScrollDown, Key::chr('n'));
    EXPECT_TRUE(keys.down(Key::chr('n')));
    EXPECT_FALSE(keys.matches(Action::ScrollDown, Key::chr('j')));
    EXPECT_EQ(keys.key(Action::ScrollDown), Key::chr('n'));
}
