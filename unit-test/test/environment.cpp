#include "test/environment.hpp"
#include <unistd.h>
#include "config.hpp"

namespace codejudge::test {
using namespace std;

filesystem::path setup_test_environment(const string &name) {
    filesystem::path dir = filesystem::temp_directory_path() / ("codejudge-test-" + name + "-" + to_string(getpid()));
    filesystem::remove_all(dir);
    filesystem::create_directories(dir);
    RUN_DIR = dir;
    DEBUG = false;
    return dir;
}

}  // namespace codejudge::test
