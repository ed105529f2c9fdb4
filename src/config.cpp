#include "config.hpp"

namespace codejudge {
using namespace std;

int COMPILE_MEM_LIMIT = 512;             // 512M
int COMPILE_TIME_LIMIT = 30;             // 30s
int COMPILE_PROC_LIMIT = 64;
int COMPILE_FILE_LIMIT = 256;
int COMPILE_OUTPUT_LIMIT = 64 * 1024;    // 64K
int SANDBOX_TMP_SIZE = 64;               // 64M
int SANDBOX_GRACE_TIME = 5;              // 5s

string SECURITY_LEVEL = "high";

filesystem::path RUNGUARD;
filesystem::path EXEC_DIR;
filesystem::path IMAGE_DIR = "/var/lib/codejudge/images";
filesystem::path RUN_DIR = "/tmp/codejudge/run";
string RUN_USER = "codejudge-run";
string RUN_GROUP;
bool DEBUG = false;

}  // namespace codejudge
