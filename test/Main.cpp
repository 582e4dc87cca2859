#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace jm;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      jm::LogHandler::setupLogHandler(&argc, &argv);
  jm::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  jm::HandleTerminate();

  string logDirectoryPattern = GetTempDirectory() + string("jm_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  jm::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log");
  jm::LogHandler::installDefaultLogger(defaultConf, "jm-test-main");

  GOOGLE_PROTOBUF_VERIFY_VERSION;
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
