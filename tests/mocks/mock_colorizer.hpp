#pragma once

#include "etabar/render/colorizer.hpp"

#include <gmock/gmock.h>

#include <memory>
#include <string>

class MockColorizer : public etabar::render::Colorizer {
public:
    MOCK_METHOD(std::string, colorize, (const std::string& color, const std::string& text),
                (const, override));

    // Default: "<color>" + text, so tests can see which color each cell got
    static std::shared_ptr<testing::NiceMock<MockColorizer>> CreateTaggingMock() {
        auto mock = std::make_shared<testing::NiceMock<MockColorizer>>();
        ON_CALL(*mock, colorize(testing::_, testing::_))
            .WillByDefault([](const std::string& color, const std::string& text) {
                return "<" + color + ">" + text;
            });
        return mock;
    }
};
