#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 每个测试进程使用自己的工作目录，避免并行运行的测试互相干扰
    atst::WORK_DIR = std::filesystem::temp_directory_path() /
                     ("atst-test-" + std::to_string(getpid()));
    std::filesystem::create_directories(atst::WORK_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(atst::WORK_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  signal(SIGPIPE, SIG_IGN);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
