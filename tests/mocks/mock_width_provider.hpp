#pragma once

#include "etabar/render/width_provider.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockWidthProvider : public etabar::render::WidthProvider {
public:
    MOCK_METHOD(int, columns, (), (const, override));

    static std::shared_ptr<testing::NiceMock<MockWidthProvider>> CreateNiceMock(int width = 80) {
        auto mock = std::make_shared<testing::NiceMock<MockWidthProvider>>();
        ON_CALL(*mock, columns()).WillByDefault(testing::Return(width));
        return mock;
    }
};
