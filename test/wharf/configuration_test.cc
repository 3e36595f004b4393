#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdlib>
#include <string>
#include <vector>

using namespace Wharf;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("WHARF_QUEUE_HEAP_SIZE");
        Configuration::getInstance().reset();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsNeedTemporaryFailureBound) {
    EXPECT_EQ(config().getHeapSize(), kDefaultPageHeapSize);
    EXPECT_EQ(config().getMaxTemporaryFailures(), 0);
    EXPECT_FALSE(config().validate());

    const auto errors = config().getValidationErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("temporary failures"), std::string::npos);
}

TEST_F(ConfigurationTest, LoadFromString) {
    const std::string yaml = R"(
wharf:
  queue:
    heap_size: 4096
    max_temporary_failures: 3
    max_messages_per_turn: 0
  service:
    service_weight: 500000
    idle_max_service_weight: 1000
  weights:
    service_queue_base: 10
    bump_service_head: 2
)";
    ASSERT_TRUE(config().loadFromString(yaml));
    EXPECT_EQ(config().getHeapSize(), 4096u);
    EXPECT_EQ(config().getMaxTemporaryFailures(), 3);
    EXPECT_EQ(config().config().queue.max_messages_per_turn.get(), 0);
    EXPECT_EQ(config().getServiceWeight(), 500000u);
    EXPECT_EQ(config().config().service.idle_max_service_weight.get(), 1000u);
    EXPECT_EQ(config().config().weights.service_queue_base.get(), 10u);
    EXPECT_EQ(config().config().weights.bump_service_head.get(), 2u);
    EXPECT_EQ(config().config().weights.service_page_item.get(), 0u);
}

TEST_F(ConfigurationTest, MissingRootKeyKeepsDefaults) {
    EXPECT_FALSE(config().loadFromString("queue:\n  heap_size: 10\n"));
    EXPECT_EQ(config().getHeapSize(), kDefaultPageHeapSize);
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config().loadFromString("wharf: [unterminated"));
}

TEST_F(ConfigurationTest, RejectsInconsistentBudgets) {
    const std::string yaml = R"(
wharf:
  queue:
    heap_size: 4
    max_temporary_failures: 1
    max_message_weight: 2000
  service:
    service_weight: 1000
    idle_max_service_weight: 5000
)";
    EXPECT_FALSE(config().loadFromString(yaml));
    EXPECT_EQ(config().getValidationErrors().size(), 3u);
}

TEST_F(ConfigurationTest, EnvironmentOverridesLoadedValue) {
    ASSERT_TRUE(config().loadFromString("wharf:\n  queue:\n    heap_size: 2048\n    max_temporary_failures: 1\n"));
    setenv("WHARF_QUEUE_HEAP_SIZE", "8192", 1);
    EXPECT_EQ(config().getHeapSize(), 8192u);
    unsetenv("WHARF_QUEUE_HEAP_SIZE");
    EXPECT_EQ(config().getHeapSize(), 2048u);
}

TEST_F(ConfigurationTest, CommandLineOverrides) {
    std::vector<std::string> args = {"wharf_sim", "--heap-size=1024", "-r", "5",
                                     "--messages-per-turn", "4", "--unknown", "x"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    config().overrideFromCommandLine(static_cast<int>(argv.size()), argv.data());

    EXPECT_EQ(config().getHeapSize(), 1024u);
    EXPECT_EQ(config().getMaxTemporaryFailures(), 5);
    EXPECT_EQ(config().config().queue.max_messages_per_turn.get(), 4);
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, ResetRestoresDefaults) {
    config().config().queue.heap_size.set(100);
    config().reset();
    EXPECT_EQ(config().getHeapSize(), kDefaultPageHeapSize);
}
