#include <core/util/logger.h>
#include <filesystem>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    puresend::core::Logger logger(spdlog::level::debug,
                                  std::filesystem::temp_directory_path() / "puresend-tests"
                                      / "logs");
    return RUN_ALL_TESTS();
}
