#include <absl/log/log.h>

#include "AbslLogInit.hpp"

extern int app_main(int argc, char** argv);
int main(int argc, char** argv) {
    TgStore_AbslLogInit();
    DLOG(INFO) << "Launching " << argv[0] << " with " << argc << " args";
    const int ret = app_main(argc, argv);
    TgStore_AbslLogDeInit();
    return ret;
}
