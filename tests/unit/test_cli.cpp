#include <gtest/gtest.h>
#include "photolink/core/cli.hpp"
#include "photolink/core/command_handler.hpp"
#include "photolink/core/command_registry.hpp"
#include "photolink/core/config.hpp"
#include <atomic>
#include <regex>
#include <thread>

using namespace photolink::core;

namespace {
    // Owns argv storage for the parser.
    class Args {
    public:
        Args(std::initializer_list<std::string> args) : storage_(args) {
            storage_.insert(storage_.begin(), "photolink");
            for (auto& arg : storage_) {
                pointers_.push_back(arg.data());
            }
        }

        int argc() const { return static_cast<int>(pointers_.size()); }
        char** argv() { return pointers_.data(); }

    private:
        std::vector<std::string> storage_;
        std::vector<char*> pointers_;
    };

    class EchoCommand : public CommandHandler {
    public:
        CommandResult execute(const std::vector<std::string>& args) override {
            return CommandResult::ok(std::to_string(args.size()));
        }
        std::string get_description() const override { return "echo"; }
        std::string get_usage() const override { return "photolink echo"; }
    };
}

TEST(CommandLineParserTest, LongAndShortOptions) {
    CommandLineParser parser("photolink");
    Args args{"--host", "10.0.0.2", "-p", "7010", "--output=/tmp/photos", "send", "shot.jpg"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv())) << parser.get_error();
    EXPECT_EQ(parser.get_option("host"), "10.0.0.2");
    EXPECT_EQ(parser.get_int_option("port").value_or(-1), 7010);
    EXPECT_EQ(parser.get_option("o"), "/tmp/photos");
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"send", "shot.jpg"}));
}

TEST(CommandLineParserTest, ShortCluster) {
    CommandLineParser parser("photolink");
    Args args{"-hp7004", "receive"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_TRUE(parser.has_option("help"));
    EXPECT_EQ(parser.get_option("port"), "7004");
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"receive"}));
}

TEST(CommandLineParserTest, DefaultsAndMissingValues) {
    CommandLineParser parser("photolink");
    Args args{"receive"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "photolink.conf");
    EXPECT_EQ(parser.get_option("host", "fallback"), "fallback");
    EXPECT_FALSE(parser.get_int_option("port").has_value());
}

TEST(CommandLineParserTest, Errors) {
    {
        CommandLineParser parser("photolink");
        Args args{"--colour"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
        EXPECT_EQ(parser.get_error(), "Unknown option: --colour");
    }
    {
        CommandLineParser parser("photolink");
        Args args{"send", "--host"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
        EXPECT_EQ(parser.get_error(), "Option --host requires a value");
    }
    {
        CommandLineParser parser("photolink");
        Args args{"--verbose=yes"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    }
    {
        CommandLineParser parser("photolink");
        Args args{"-x"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    }
}

TEST(CommandLineParserTest, DoubleDashEndsOptions) {
    CommandLineParser parser("photolink");
    Args args{"send", "--", "--odd-name.jpg"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"send", "--odd-name.jpg"}));
}

TEST(CommandLineParserTest, AppliesOverridesToConfig) {
    CommandLineParser parser("photolink");
    Args args{"--port", "7100", "--device", "/dev/rfcomm0", "--verbose"};
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));

    Config config;
    config.set_defaults();
    ASSERT_TRUE(parser.apply_to(config));

    EXPECT_EQ(config.get_int("listen.port"), 7100);
    EXPECT_EQ(config.get_string("peer.service"), "7100");
    EXPECT_EQ(config.get_string("peer.device"), "/dev/rfcomm0");
    EXPECT_EQ(config.get_string("peer.host"), "127.0.0.1");
}

TEST(CommandLineParserTest, RejectsBadPort) {
    for (std::string port : {"70000", "-1", "12ab"}) {
        CommandLineParser parser("photolink");
        Args args{"--host", "h", "--port", port};
        ASSERT_TRUE(parser.parse(args.argc(), args.argv()));

        Config config;
        config.set("peer.host", "before");
        EXPECT_FALSE(parser.apply_to(config)) << port;
        EXPECT_EQ(config.get_string("peer.host"), "before");
    }
}

TEST(CommandRegistryTest, DispatchesByFirstArgument) {
    CommandRegistry registry;
    registry.register_command("echo", std::make_unique<EchoCommand>());

    auto result = registry.dispatch({"echo", "a", "b"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "3");

    EXPECT_NE(registry.find("send"), nullptr);
    EXPECT_NE(registry.find("receive"), nullptr);
    EXPECT_EQ(registry.find("share"), nullptr);
}

TEST(CommandRegistryTest, UnknownAndMissingCommands) {
    CommandRegistry registry;

    auto unknown = registry.dispatch({"share"});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.exit_code, 1);
    EXPECT_NE(unknown.message.find("Unknown command: share"), std::string::npos);
    EXPECT_NE(unknown.message.find("photolink send <file>"), std::string::npos);

    EXPECT_FALSE(registry.dispatch({}).success);
}

TEST(CommandRegistryTest, SendValidatesArguments) {
    CommandRegistry registry;

    EXPECT_FALSE(registry.dispatch({"send"}).success);

    auto missing = registry.dispatch({"send", "no_such_photo.jpg"});
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.message.find("no_such_photo.jpg"), std::string::npos);
}

TEST(PhotoFilenameTest, FormatsTimestampAndSequence) {
    auto name = photo_filename(std::chrono::system_clock::now(), 3);
    EXPECT_TRUE(std::regex_match(name, std::regex(R"(photo_\d{8}_\d{6}_3\.jpg)"))) << name;
}

TEST(PhotoFilenameTest, ConcurrentCallsAgree) {
    auto morning = std::chrono::system_clock::from_time_t(1700000000);
    auto evening = morning + std::chrono::hours(11) + std::chrono::minutes(7);
    auto expected_morning = photo_filename(morning, 1);
    auto expected_evening = photo_filename(evening, 2);
    ASSERT_NE(expected_morning, expected_evening);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 500; ++i) {
                bool use_morning = (i + t) % 2 == 0;
                auto name = use_morning ? photo_filename(morning, 1) : photo_filename(evening, 2);
                if (name != (use_morning ? expected_morning : expected_evening)) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}
