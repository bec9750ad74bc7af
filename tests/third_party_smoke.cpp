#include "CLI11.hpp"

#include <string>
#include <string_view>
#include <thread>

int main() {
    CLI::App app{"smoke"};
    std::string shell;
    app.add_option("--shell", shell)->check(CLI::IsMember({"bash", "cmd"}));

    char arg0[] = "smoke";
    char arg1[] = "--shell";
    char arg2[] = "bash";
    char *argv[] = {arg0, arg1, arg2};
    try {
        app.parse(3, argv);
    } catch (const CLI::ParseError &) {
        return 1;
    }
    if (shell != "bash") {
        return 1;
    }

    const std::string_view version{CLI11_VERSION};
    if (version.empty()) {
        return 1;
    }

    bool ran = false;
    std::thread worker{[&ran] { ran = true; }};
    worker.join();
    if (!ran) {
        return 1;
    }

    return 0;
}
