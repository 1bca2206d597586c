#include <mcp_probe/cli/commands.hpp>
#include <mcp_probe/core/log.hpp>

#include <exception>
#include <iostream>
#include <string>

int main(int argc, const char* argv[]) {
    try {
        return mcp_probe::RunCommand(argc, argv, {std::cin, std::cout, std::cerr});
    } catch (const std::exception& e) {
        mcp_probe::LogError("main", std::string("unhandled error: ") + e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return mcp_probe::kExitFailure;
    }
}
