#include <Python.h>
#include <glog/logging.h>
#include "common/python.hpp"
#include "evaluator/python_evaluator.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    arena::evaluator::install_audit_hook();
    Py_Initialize();
    // 测试线程和求值器通过 PyGILState 获取 GIL
    thread_state = PyEval_SaveThread();
  }
  virtual void TearDown() {
    PyEval_RestoreThread(thread_state);
  }

 private:
  PyThreadState *thread_state = nullptr;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
