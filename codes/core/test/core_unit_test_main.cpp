// =============================================================================
//  H2 Mux Client - Core Unit Test Main
//  文件: core_unit_test_main.cpp
//  描述: 核心模块单元测试主入口
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include "utils/logger.hpp"

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    // 只输出告警以上日志
    h2_mux_client::utils::Logger::instance().set_level(h2_mux_client::utils::LogLevel::WARN);
    return RUN_ALL_TESTS();
}

// 文件结束
