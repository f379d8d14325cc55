#include "base/base.h"
#include "modules/io/log.h"

namespace {

bool g_covmark_initted = false;

}  // namespace

void covmark_init(int* argc, char*** argv) {
  CHECK(!g_covmark_initted) << "Must not call covmark_init more than once.";
  google::InitGoogleLogging((*argv)[0]);
  log_init((*argv)[0], -1);
  g_covmark_initted = true;
}
