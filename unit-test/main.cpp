#include <glog/logging.h>
#include <memory>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // the validator parses with the embedded interpreter
    python = std::make_unique<pysandbox::python_runtime>();
  }
  virtual void TearDown() {
    python.reset();
  }

 private:
  std::unique_ptr<pysandbox::python_runtime> python;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
