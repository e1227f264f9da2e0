// main.cpp
#include "tmpltool/cli/app.h"

int main(int argc, char* argv[]) {
    return tmpltool::run_cli(argc, argv);
}
