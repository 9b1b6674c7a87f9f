#include <string>
#include <vector>

#include "app/ScribeAuditCli.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    scribeaudit::app::ScribeAuditCli cli;
    return cli.Run(args);
}
