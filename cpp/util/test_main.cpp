#include <kj/async-unix.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

// Child processes are awaited through the event port, which needs SIGCHLD
// to be captured before any thread or event loop exists.
int main(int argc, char** argv) {
  kj::UnixEventPort::captureChildExit();
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
