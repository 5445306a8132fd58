#include "etabar/render/width_provider.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <unistd.h>

using namespace etabar::render;

class TerminalWidthProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* columns = std::getenv("COLUMNS");
        if (columns) {
            saved_columns_ = columns;
        }
        unsetenv("COLUMNS");

        ASSERT_EQ(pipe(fds_), 0);
    }

    void TearDown() override {
        close(fds_[0]);
        close(fds_[1]);

        if (saved_columns_) {
            setenv("COLUMNS", saved_columns_->c_str(), 1);
        } else {
            unsetenv("COLUMNS");
        }
    }

    // A pipe is never a terminal, so only COLUMNS can supply a width
    int pipeFd() const { return fds_[1]; }

private:
    int fds_[2] = {-1, -1};
    std::optional<std::string> saved_columns_;
};

TEST(FixedWidthProviderTest, ReturnsConfiguredWidth) {
    EXPECT_EQ(FixedWidthProvider(120).columns(), 120);
    EXPECT_EQ(FixedWidthProvider(0).columns(), 0);
}

TEST(FixedWidthProviderTest, NegativeWidthBecomesZero) {
    EXPECT_EQ(FixedWidthProvider(-10).columns(), 0);
}

TEST_F(TerminalWidthProviderTest, NotATerminal_NoEnv_ReturnsZero) {
    TerminalWidthProvider provider(pipeFd());
    EXPECT_EQ(provider.columns(), 0);
}

TEST_F(TerminalWidthProviderTest, NotATerminal_UsesColumnsEnv) {
    setenv("COLUMNS", "132", 1);
    TerminalWidthProvider provider(pipeFd());
    EXPECT_EQ(provider.columns(), 132);
}

TEST_F(TerminalWidthProviderTest, RereadsEnvOnEveryCall) {
    TerminalWidthProvider provider(pipeFd());

    setenv("COLUMNS", "100", 1);
    EXPECT_EQ(provider.columns(), 100);

    setenv("COLUMNS", "60", 1);
    EXPECT_EQ(provider.columns(), 60);
}

TEST_F(TerminalWidthProviderTest, IgnoresMalformedColumnsEnv) {
    TerminalWidthProvider provider(pipeFd());

    for (const char* value : {"", "abc", "80x", "-5", "0", "99999999"}) {
        setenv("COLUMNS", value, 1);
        EXPECT_EQ(provider.columns(), 0) << "COLUMNS=" << value;
    }
}
