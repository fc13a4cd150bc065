#include <gtest/gtest.h>

#include <QtGlobal>
#include <string>
#include <vector>

namespace {
// Library code logs through qInfo/qWarning; keep test output to gtest's own lines
// unless JSON_NODE_EDIT_TEST_LOG=1.
void testMessageHandler(QtMsgType type, const QMessageLogContext &, const QString &msg)
{
    if (qEnvironmentVariableIntValue("JSON_NODE_EDIT_TEST_LOG") == 1 || type == QtFatalMsg) {
        fprintf(stderr, "%s\n", msg.toLocal8Bit().constData());
    }
    if (type == QtFatalMsg) {
        abort();
    }
}
}

int main(int argc, char **argv) {
  qInstallMessageHandler(testMessageHandler);

  // build new arg list
  std::vector<char*> args;
  for (int i=0; i<argc; i++)
      args.push_back(argv[i]);

  // add --gtest_catch_exceptions=0
  std::string noCatch{"--gtest_catch_exceptions=0"};
  args.push_back(noCatch.data());

  argc = static_cast<int>(args.size());
  argv = args.data();

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
