/**
 * @file MockCommandExecutor.hpp
 * @brief Google Mock implementation of ICommandExecutor
 */

#pragma once

#include "interfaces/ICommandExecutor.hpp"

#include <gmock/gmock.h>

#include <algorithm>
#include <memory>
#include <string>

class MockCommandExecutor : public ICommandExecutor {
public:
    MOCK_METHOD((std::expected<CommandResult, util::Error>), execute, (const Command& command),
                (override));

    // Helper: Create a nice mock whose commands fail to spawn unless told otherwise
    static std::shared_ptr<MockCommandExecutor> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockCommandExecutor>>();

        ON_CALL(*mock, execute(testing::_))
            .WillByDefault(testing::Return(std::expected<CommandResult, util::Error>(
                std::unexpected(util::Error{"not configured", util::ErrorCode::SPAWN_FAILED}))));

        return mock;
    }

    // Helper: A finished command with the given output
    static std::expected<CommandResult, util::Error> Output(std::string stdout_data,
                                                            int exit_code = 0) {
        return CommandResult{.exit_code = exit_code,
                             .stdout_data = std::move(stdout_data),
                             .stderr_data = "",
                             .duration = std::chrono::milliseconds{5}};
    }
};

// Matches a Command whose argv contains the given argument
MATCHER_P(HasArg, needle, "") {
    return std::ranges::find(arg.argv, std::string(needle)) != arg.argv.end();
}
