#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "tbc/foundation/config_manager.hpp"
#include "tbc/foundation/error_code.hpp"
#include "tbc/foundation/game_error.hpp"
#include "tbc/foundation/game_result.hpp"

using namespace tbc::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ContentNotFound), "Content");
    EXPECT_EQ(errorSubsystem(ErrorCode::GroupNotInstantiable), "Content");
    EXPECT_EQ(errorSubsystem(ErrorCode::FactoryFailed), "Setup");
    EXPECT_EQ(errorSubsystem(ErrorCode::SummonOwnerMissing), "Setup");
    EXPECT_EQ(errorSubsystem(ErrorCode::TargetNotAlive), "Action");
    EXPECT_EQ(errorSubsystem(ErrorCode::RngStateInvalid), "Rng");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidJsonData), "Serialization");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
}

TEST(ErrorCodeTest, ActionRejectionRange) {
    EXPECT_TRUE(isActionRejection(ErrorCode::CombatantNotFound));
    EXPECT_TRUE(isActionRejection(ErrorCode::InsufficientMp));
    EXPECT_TRUE(isActionRejection(ErrorCode::InvalidAction));
    EXPECT_FALSE(isActionRejection(ErrorCode::FactoryFailed));
    EXPECT_FALSE(isActionRejection(ErrorCode::ContentNotFound));
    EXPECT_FALSE(isActionRejection(ErrorCode::Success));
}

// --- GameError tests ---

TEST(GameErrorTest, DefaultConstruction) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GameErrorTest, CodeAndMessage) {
    GameError err(ErrorCode::TargetNotAlive, "goblin is already defeated");
    EXPECT_EQ(err.code(), ErrorCode::TargetNotAlive);
    EXPECT_EQ(err.message(), "goblin is already defeated");
    EXPECT_EQ(err.subsystem(), "Action");
    EXPECT_TRUE(err.isRejection());
    EXPECT_FALSE(err.isSuccess());
}

TEST(GameErrorTest, NestedErrorAsContext) {
    GameError cause(ErrorCode::ContentNotFound, "unknown enemy id: wyrm");
    GameError err(ErrorCode::FactoryFailed, "enemy 'wyrm' not found", cause);
    ASSERT_TRUE(err.hasContext());
    const auto* inner = err.context<GameError>();
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->code(), ErrorCode::ContentNotFound);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(GameErrorTest, SuccessCheck) {
    GameError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- GameResult tests ---

TEST(GameResultTest, OkValue) {
    auto result = GameResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(GameResultTest, ErrorValue) {
    auto result = GameResult<int>::err(
        GameError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(GameResultTest, VoidOk) {
    auto result = GameResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(GameResultTest, VoidError) {
    auto result = GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed, "fail"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(GameResultTest, PropagateChangesValueType) {
    auto result = GameResult<int>::err(GameError(ErrorCode::BattleOver, "over"));
    auto moved = result.propagate<std::string>();
    ASSERT_TRUE(moved.hasError());
    EXPECT_EQ(moved.error().code(), ErrorCode::BattleOver);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("tbc_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("combat.yaml", R"(
threat:
  base_divisor: 4
  label: "aggro"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto divisor = config.get<int>("threat.base_divisor");
    ASSERT_TRUE(divisor.hasValue());
    EXPECT_EQ(divisor.value(), 4);

    auto label = config.get<std::string>("threat.label");
    ASSERT_TRUE(label.hasValue());
    EXPECT_EQ(label.value(), "aggro");
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("damage:\n  minimum: 2\n").hasValue());
    EXPECT_EQ(config.size(), 1u);
    EXPECT_EQ(config.get<int>("damage.minimum").value(), 2);
}

TEST_F(ConfigManagerTest, MalformedStringIsRejected) {
    ConfigManager config;
    auto result = config.loadFromString("threat: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("present: 7\nwrong: text\n").hasValue());

    EXPECT_EQ(config.getOr<int>("present", 1).value(), 7);
    EXPECT_EQ(config.getOr<int>("absent", 1).value(), 1);

    auto wrong = config.getOr<int>("wrong", 1);
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("debuff.duration_rounds", 3);

    auto result = config.get<int>("debuff.duration_rounds");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 3);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadFromString("c: 3\n").hasValue());

    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("c"));
}
