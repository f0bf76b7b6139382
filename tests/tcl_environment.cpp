#include <gtest/gtest.h>
#include <tcl.h>

// Tcl wants its executable located before the first interpreter or list call.
class TclEnvironment : public ::testing::Environment {
 public:
  void SetUp() override { Tcl_FindExecutable(NULL); }
};

static ::testing::Environment *const tcl_env =
  ::testing::AddGlobalTestEnvironment(new TclEnvironment);
