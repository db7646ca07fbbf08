/**
 * @file test_main.cpp
 * @brief Main entry point for the resilient data store unit tests
 * @date 2025-12-01
 */

#include <gtest/gtest.h>
#include <lap/core/CMemory.hpp>
#include <lap/log/CLog.hpp>

int main(int argc, char **argv)
{
    ::lap::core::MemoryManager::getInstance();  // Initialize memory manager first

    // Initialize logging
    ::lap::log::LogManager::getInstance().initialize();

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
