#include <mise/server/config.hpp>
#include <mise/server/server.hpp>

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  try {
    // Command line (and optionally a config file)
    auto config = mise::server::Config::LoadFromArgs(argc, argv);

    mise::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
