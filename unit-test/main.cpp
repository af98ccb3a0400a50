#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    codejudge::setup_test_environment();
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
